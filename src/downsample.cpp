#include "downsample.hpp"

#include <algorithm>
#include <climits>
#include <cmath>
#include <stdexcept>

GridSize compute_grid_size(int src_w, int src_h, int max_size) {
    if (src_w <= 0 || src_h <= 0) {
        throw std::invalid_argument("Source image has zero area");
    }
    if (max_size <= 0) {
        throw std::invalid_argument("Target size must be positive");
    }

    double scale = std::min(static_cast<double>(max_size) / src_w,
                            static_cast<double>(max_size) / src_h);
    GridSize grid;
    grid.width = std::max(1, static_cast<int>(std::floor(src_w * scale)));
    grid.height = std::max(1, static_cast<int>(std::floor(src_h * scale)));
    return grid;
}

// Round-half-up mean of a non-negative sum
static uint8_t rounded_mean(uint32_t sum, uint32_t count) {
    return static_cast<uint8_t>((2 * sum + count) / (2 * count));
}

std::vector<Rgba> average_blocks(const Raster& sampled, int grid_w, int grid_h, int scale) {
    if (grid_w <= 0 || grid_h <= 0 || scale <= 0) {
        throw std::invalid_argument("Grid and scale must be at least 1");
    }
    if (sampled.width != grid_w * scale || sampled.height != grid_h * scale ||
        sampled.pixels.size() != static_cast<size_t>(sampled.width) * sampled.height * 4) {
        throw std::invalid_argument("Sampled raster does not match grid size");
    }

    const uint32_t count = static_cast<uint32_t>(scale) * scale;
    std::vector<Rgba> cells;
    cells.reserve(static_cast<size_t>(grid_w) * grid_h);

    for (int y = 0; y < grid_h; y++) {
        for (int x = 0; x < grid_w; x++) {
            uint32_t sum[4] = {0, 0, 0, 0};
            for (int sy = y * scale; sy < (y + 1) * scale; sy++) {
                for (int sx = x * scale; sx < (x + 1) * scale; sx++) {
                    const uint8_t* px = sampled.at(sx, sy);
                    for (int c = 0; c < 4; c++) {
                        sum[c] += px[c];
                    }
                }
            }
            cells.push_back({
                rounded_mean(sum[0], count),
                rounded_mean(sum[1], count),
                rounded_mean(sum[2], count),
                rounded_mean(sum[3], count),
            });
        }
    }

    return cells;
}

std::vector<Rgba> downsample(const Raster& src, int grid_w, int grid_h, int supersample) {
    if (src.empty()) {
        throw std::invalid_argument("Source image has zero area");
    }
    if (grid_w <= 0 || grid_h <= 0) {
        throw std::invalid_argument("Target grid must be at least 1x1");
    }
    if (supersample <= 0) {
        throw std::invalid_argument("Supersampling factor must be at least 1");
    }
    if (grid_w > INT_MAX / supersample || grid_h > INT_MAX / supersample) {
        throw std::invalid_argument("Supersampled grid is too large");
    }

    Raster sampled = resize_raster(src, grid_w * supersample, grid_h * supersample);
    return average_blocks(sampled, grid_w, grid_h, supersample);
}
