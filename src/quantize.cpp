#include "quantize.hpp"

#include <algorithm>
#include <climits>
#include <stdexcept>
#include <utility>

using Bucket = std::vector<Color>;

int split_depth(int color_count) {
    int depth = 0;
    while (depth < 31 && (1 << depth) < color_count) {
        depth++;
    }
    return depth;
}

std::vector<Color> visible_colors(const std::vector<Rgba>& cells) {
    std::vector<Color> colors;
    colors.reserve(cells.size());
    for (const auto& c : cells) {
        if (c.a > VISIBLE_ALPHA_THRESHOLD) {
            colors.push_back(c.rgb());
        }
    }
    return colors;
}

// --- Median cut ---

static uint8_t channel_value(const Color& c, int channel) {
    switch (channel) {
    case 0: return c.r;
    case 1: return c.g;
    default: return c.b;
    }
}

/// Channel (0=R, 1=G, 2=B) with the widest value range; ties prefer R, then G
static int widest_channel(const Bucket& bucket) {
    int min_r = 255, max_r = 0, min_g = 255, max_g = 0, min_b = 255, max_b = 0;
    for (const auto& c : bucket) {
        min_r = std::min(min_r, (int)c.r); max_r = std::max(max_r, (int)c.r);
        min_g = std::min(min_g, (int)c.g); max_g = std::max(max_g, (int)c.g);
        min_b = std::min(min_b, (int)c.b); max_b = std::max(max_b, (int)c.b);
    }
    int range_r = max_r - min_r;
    int range_g = max_g - min_g;
    int range_b = max_b - min_b;
    if (range_r >= range_g && range_r >= range_b) return 0;
    return range_g >= range_b ? 1 : 2;
}

static void split_bucket(Bucket bucket, int depth, std::vector<Bucket>& leaves) {
    if (depth == 0 || bucket.empty()) {
        leaves.push_back(std::move(bucket));
        return;
    }

    int channel = widest_channel(bucket);
    // Stable, so colors equal on this channel keep their relative order
    std::stable_sort(bucket.begin(), bucket.end(), [channel](const Color& a, const Color& b) {
        return channel_value(a, channel) < channel_value(b, channel);
    });

    size_t mid = bucket.size() / 2;
    split_bucket(Bucket(bucket.begin(), bucket.begin() + mid), depth - 1, leaves);
    split_bucket(Bucket(bucket.begin() + mid, bucket.end()), depth - 1, leaves);
}

static Color bucket_mean(const Bucket& bucket) {
    uint64_t r = 0, g = 0, b = 0;
    for (const auto& c : bucket) {
        r += c.r;
        g += c.g;
        b += c.b;
    }
    uint64_t n = bucket.size();
    // Round half up
    return {
        static_cast<uint8_t>((2 * r + n) / (2 * n)),
        static_cast<uint8_t>((2 * g + n) / (2 * n)),
        static_cast<uint8_t>((2 * b + n) / (2 * n)),
    };
}

Palette median_cut(std::vector<Color> colors, int color_count) {
    if (color_count <= 0 || colors.empty()) {
        return {};
    }

    std::vector<Bucket> leaves;
    split_bucket(std::move(colors), split_depth(color_count), leaves);
    if (leaves.size() > static_cast<size_t>(color_count)) {
        leaves.resize(color_count);
    }

    Palette palette;
    for (const auto& bucket : leaves) {
        if (!bucket.empty()) {
            palette.push_back(bucket_mean(bucket));
        }
    }
    return palette;
}

Palette median_cut_quantize(const std::vector<Rgba>& cells, int color_count) {
    if (color_count <= 0) {
        return {};
    }

    // Repeated entries can never win a nearest-color lookup, keep the first of each
    Palette palette;
    for (const auto& c : median_cut(visible_colors(cells), color_count)) {
        if (std::find(palette.begin(), palette.end(), c) == palette.end()) {
            palette.push_back(c);
        }
    }
    return palette;
}

// --- Nearest color ---

int nearest_color_index(const Color& color, const Palette& palette) {
    if (palette.empty()) {
        throw std::invalid_argument("Cannot map a color onto an empty palette");
    }

    int best_idx = 0;
    int best_dist = INT_MAX;
    for (int i = 0; i < (int)palette.size(); i++) {
        int dr = color.r - palette[i].r;
        int dg = color.g - palette[i].g;
        int db = color.b - palette[i].b;
        int dist = dr * dr + dg * dg + db * db;
        if (dist < best_dist) {
            best_dist = dist;
            best_idx = i;
        }
    }
    return best_idx;
}

Color nearest_color(const Color& color, const Palette& palette) {
    return palette[nearest_color_index(color, palette)];
}

std::vector<Rgba> apply_palette(const std::vector<Rgba>& cells, const Palette& palette) {
    if (palette.empty()) {
        return cells;
    }

    std::vector<Rgba> mapped;
    mapped.reserve(cells.size());
    for (const auto& cell : cells) {
        Color c = nearest_color(cell.rgb(), palette);
        mapped.push_back({c.r, c.g, c.b, cell.a});
    }
    return mapped;
}
