#pragma once

#include <cstdint>
#include <vector>

/// RGB color, used for raw cell colors and palette entries alike
struct Color {
    uint8_t r, g, b;
};

inline bool operator==(const Color& a, const Color& b) {
    return a.r == b.r && a.g == b.g && a.b == b.b;
}

inline bool operator!=(const Color& a, const Color& b) {
    return !(a == b);
}

/// RGBA color with straight (non-premultiplied) alpha
struct Rgba {
    uint8_t r, g, b, a;

    Color rgb() const { return {r, g, b}; }
};

inline bool operator==(const Rgba& a, const Rgba& b) {
    return a.r == b.r && a.g == b.g && a.b == b.b && a.a == b.a;
}

inline bool operator!=(const Rgba& a, const Rgba& b) {
    return !(a == b);
}

/// Ordered list of representative colors. Empty means "no palette".
using Palette = std::vector<Color>;

/// Cells with alpha above this take part in palette construction
static const int VISIBLE_ALPHA_THRESHOLD = 128;
