#include "surface.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

static float overlap(float a0, float a1, float b0, float b1) {
    return std::max(0.0f, std::min(a1, b1) - std::max(a0, b0));
}

static uint8_t to_byte(float v) {
    return static_cast<uint8_t>(std::clamp((int)std::lround(v), 0, 255));
}

RasterSurface::RasterSurface(int width, int height) {
    if (width <= 0 || height <= 0) {
        throw std::invalid_argument("Surface must be at least 1x1");
    }
    raster_ = Raster(width, height);
}

void RasterSurface::set_fill_color(const Color& color, float alpha) {
    fill_color_ = color;
    fill_alpha_ = std::clamp(alpha, 0.0f, 1.0f);
}

void RasterSurface::fill_rect(float x, float y, float w, float h) {
    if (w <= 0 || h <= 0) return;
    Box box{x, y, x + w, y + h};
    paint(box, nullptr, fill_color_, fill_alpha_);
}

void RasterSurface::set_stroke(const Color& color, float alpha, float line_width) {
    stroke_color_ = color;
    stroke_alpha_ = std::clamp(alpha, 0.0f, 1.0f);
    line_width_ = std::max(0.0f, line_width);
}

void RasterSurface::stroke_rect(float x, float y, float w, float h) {
    if (line_width_ <= 0 || w < 0 || h < 0) return;
    float half = line_width_ / 2;
    Box outer{x - half, y - half, x + w + half, y + h + half};
    Box inner{x + half, y + half, x + w - half, y + h - half};
    bool hollow = inner.x1 > inner.x0 && inner.y1 > inner.y0;
    paint(outer, hollow ? &inner : nullptr, stroke_color_, stroke_alpha_);
}

void RasterSurface::paint(const Box& outer, const Box* inner, const Color& color, float alpha) {
    if (alpha <= 0) return;

    int px0 = std::max(0, (int)std::floor(outer.x0));
    int py0 = std::max(0, (int)std::floor(outer.y0));
    int px1 = std::min(raster_.width, (int)std::ceil(outer.x1));
    int py1 = std::min(raster_.height, (int)std::ceil(outer.y1));

    for (int py = py0; py < py1; py++) {
        for (int px = px0; px < px1; px++) {
            float cover = overlap(outer.x0, outer.x1, px, px + 1.0f) *
                          overlap(outer.y0, outer.y1, py, py + 1.0f);
            if (inner) {
                cover -= overlap(inner->x0, inner->x1, px, px + 1.0f) *
                         overlap(inner->y0, inner->y1, py, py + 1.0f);
            }
            if (cover > 0) {
                blend_pixel(px, py, color, alpha * std::min(cover, 1.0f));
            }
        }
    }
}

void RasterSurface::blend_pixel(int x, int y, const Color& color, float alpha) {
    uint8_t* px = raster_.at(x, y);
    float dst_a = px[3] / 255.0f;
    float out_a = alpha + dst_a * (1 - alpha);
    if (out_a <= 0) {
        px[0] = px[1] = px[2] = px[3] = 0;
        return;
    }

    const float src[3] = {(float)color.r, (float)color.g, (float)color.b};
    for (int c = 0; c < 3; c++) {
        px[c] = to_byte((src[c] * alpha + px[c] * dst_a * (1 - alpha)) / out_a);
    }
    px[3] = to_byte(out_a * 255);
}
