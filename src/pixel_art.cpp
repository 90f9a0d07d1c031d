#include "pixel_art.hpp"
#include "downsample.hpp"
#include "quantize.hpp"

#include <algorithm>
#include <climits>
#include <cstdlib>
#include <stdexcept>

int parse_int_or(const std::string& text, int fallback) {
    const char* begin = text.c_str();
    char* end = nullptr;
    long long value = std::strtoll(begin, &end, 10);
    if (end == begin || value == 0) {
        return fallback;
    }
    return static_cast<int>(std::clamp<long long>(value, INT_MIN, INT_MAX));
}

ConvertOptions clamp_options(const ConvertOptions& options) {
    ConvertOptions clamped = options;
    clamped.color_count = std::clamp(options.color_count, MIN_COLOR_COUNT, MAX_COLOR_COUNT);
    clamped.max_size = std::clamp(options.max_size, MIN_GRID_SIZE, MAX_GRID_SIZE);
    clamped.block_size = std::clamp(options.block_size, 1, MAX_BLOCK_SIZE);
    clamped.supersample = std::max(1, options.supersample);
    return clamped;
}

PixelArt convert_to_pixel_art(const Raster& src, const ConvertOptions& options) {
    if (src.empty()) {
        throw std::invalid_argument("Source image has zero area");
    }

    GridSize grid = compute_grid_size(src.width, src.height, options.max_size);

    PixelArt art;
    art.width = grid.width;
    art.height = grid.height;
    art.cells = downsample(src, grid.width, grid.height, options.supersample);
    art.palette = median_cut_quantize(art.cells, options.color_count);
    art.colors = apply_palette(art.cells, art.palette);
    return art;
}

void render_pixel_art(const PixelArt& art, DrawingSurface& surface, int block_size,
                      bool draw_grid) {
    if (block_size <= 0) {
        throw std::invalid_argument("Block size must be at least 1");
    }
    if (art.colors.size() != static_cast<size_t>(art.width) * art.height) {
        throw std::invalid_argument("Pixel art has inconsistent dimensions");
    }

    const float n = static_cast<float>(block_size);
    for (int y = 0; y < art.height; y++) {
        for (int x = 0; x < art.width; x++) {
            const Rgba& c = art.color_at(x, y);
            surface.set_fill_color(c.rgb(), c.a / 255.0f);
            surface.fill_rect(x * n, y * n, n, n);

            if (draw_grid) {
                surface.set_stroke(GRID_LINE_COLOR, GRID_LINE_ALPHA, GRID_LINE_WIDTH);
                surface.stroke_rect(x * n + 0.25f, y * n + 0.25f, n - 0.5f, n - 0.5f);
            }
        }
    }
}

Raster render_to_raster(const PixelArt& art, int block_size, bool draw_grid) {
    if (art.width <= 0 || art.height <= 0) {
        throw std::invalid_argument("Pixel art is empty");
    }
    if (block_size <= 0) {
        throw std::invalid_argument("Block size must be at least 1");
    }
    RasterSurface surface(art.width * block_size, art.height * block_size);
    render_pixel_art(art, surface, block_size, draw_grid);
    return surface.take_raster();
}
