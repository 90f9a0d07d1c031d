#pragma once

#include "color.hpp"
#include "image.hpp"

#include <vector>

/// Default supersampling factor applied before block averaging
static const int DEFAULT_SUPERSAMPLE = 4;

/// Target grid dimensions in cells
struct GridSize {
    int width;
    int height;
};

/// Fit a src_w x src_h image inside max_size x max_size, keeping aspect ratio.
/// Each dimension is floored and clamped to at least 1.
GridSize compute_grid_size(int src_w, int src_h, int max_size);

/// Average each scale x scale block of `sampled` into one cell.
/// `sampled` must be exactly (grid_w * scale) x (grid_h * scale).
/// Returns grid_w * grid_h colors in row-major order.
std::vector<Rgba> average_blocks(const Raster& sampled, int grid_w, int grid_h, int scale);

/// Reduce `src` to grid_w x grid_h cells: resample to the supersampled size, then
/// box-average each block. Throws std::invalid_argument on empty input or a zero-sized grid.
std::vector<Rgba> downsample(const Raster& src, int grid_w, int grid_h,
                             int supersample = DEFAULT_SUPERSAMPLE);
