#pragma once

#include "color.hpp"

#include <vector>

/// Number of median-cut split levels for a palette of `color_count` entries: ceil(log2(color_count)).
/// Returns 0 for color_count <= 1.
int split_depth(int color_count);

/// RGB of every cell whose alpha exceeds VISIBLE_ALPHA_THRESHOLD, in cell order
std::vector<Color> visible_colors(const std::vector<Rgba>& cells);

/// Median-cut palette over an explicit color list.
/// Returns at most `color_count` colors, or an empty palette when
/// color_count <= 0 or `colors` is empty.
Palette median_cut(std::vector<Color> colors, int color_count);

/// Palette for a grid of cells: visible_colors() followed by median_cut(),
/// with repeated entries collapsed to their first occurrence
Palette median_cut_quantize(const std::vector<Rgba>& cells, int color_count);

/// Index of the palette entry closest to `color` (squared RGB distance, first match wins).
/// Throws std::invalid_argument on an empty palette.
int nearest_color_index(const Color& color, const Palette& palette);

/// Palette entry closest to `color`
Color nearest_color(const Color& color, const Palette& palette);

/// Replace each cell's RGB with its nearest palette entry, keeping alpha.
/// An empty palette leaves the cells unchanged.
std::vector<Rgba> apply_palette(const std::vector<Rgba>& cells, const Palette& palette);
