#pragma once

#include "color.hpp"
#include "downsample.hpp"
#include "image.hpp"
#include "surface.hpp"

#include <string>
#include <vector>

/// Bounds and defaults for user-supplied conversion settings
static const int MIN_COLOR_COUNT = 24;
static const int MAX_COLOR_COUNT = 256;
static const int DEFAULT_COLOR_COUNT = 24;
static const int MIN_GRID_SIZE = 20;
static const int MAX_GRID_SIZE = 200;
static const int DEFAULT_GRID_SIZE = 80;
static const int DEFAULT_BLOCK_SIZE = 12;
static const int MAX_BLOCK_SIZE = 64;

/// Grid outline drawn around every block
static const Color GRID_LINE_COLOR = {0, 0, 0};
static const float GRID_LINE_ALPHA = 0.08f;
static const float GRID_LINE_WIDTH = 0.5f;

struct ConvertOptions {
    int color_count = DEFAULT_COLOR_COUNT;  // palette size requested from median cut
    int max_size = DEFAULT_GRID_SIZE;       // longest grid side, in cells
    int block_size = DEFAULT_BLOCK_SIZE;    // on-screen size of one cell, in pixels
    int supersample = DEFAULT_SUPERSAMPLE;
    bool draw_grid = true;
};

/// Leading integer of `text` (saturated to the int range), or `fallback` when
/// there is none or it is 0. Apply clamp_options afterwards.
int parse_int_or(const std::string& text, int fallback);

/// Clamp color_count to [24, 256], max_size to [20, 200], block_size to [1, 64],
/// supersample to >= 1
ConvertOptions clamp_options(const ConvertOptions& options);

/// Result of a conversion: a width x height grid of cells
struct PixelArt {
    int width = 0;
    int height = 0;
    std::vector<Rgba> cells;   // averaged colors, before quantization
    Palette palette;           // empty when quantization was skipped
    std::vector<Rgba> colors;  // final colors, row-major

    const Rgba& color_at(int x, int y) const { return colors[static_cast<size_t>(y) * width + x]; }
};

/// Downsample, quantize and map `src`. Options are used as given; call clamp_options first
/// to apply the user-facing limits.
PixelArt convert_to_pixel_art(const Raster& src, const ConvertOptions& options);

/// Paint every cell as a block_size square at (x * block_size, y * block_size),
/// in row-major order, optionally outlined with the grid line.
void render_pixel_art(const PixelArt& art, DrawingSurface& surface, int block_size,
                      bool draw_grid = true);

/// Render into a new (width * block_size) x (height * block_size) raster
Raster render_to_raster(const PixelArt& art, int block_size, bool draw_grid = true);
