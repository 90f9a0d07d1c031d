#pragma once

#include "color.hpp"
#include "image.hpp"

#include <utility>

/// Abstract 2D drawing target the renderer paints onto.
/// Coordinates are in pixels and may be fractional.
class DrawingSurface {
public:
    virtual ~DrawingSurface() = default;

    /// Set the fill color; alpha is an opacity in [0, 1]
    virtual void set_fill_color(const Color& color, float alpha) = 0;

    /// Fill an axis-aligned rectangle with the current fill color
    virtual void fill_rect(float x, float y, float w, float h) = 0;

    /// Set the outline color, opacity in [0, 1] and line width
    virtual void set_stroke(const Color& color, float alpha, float line_width) = 0;

    /// Outline an axis-aligned rectangle, the line centered on its edges
    virtual void stroke_rect(float x, float y, float w, float h) = 0;
};

/// Software surface backed by an RGBA raster, initially fully transparent.
/// Shapes are antialiased by exact pixel coverage and blended source-over.
class RasterSurface : public DrawingSurface {
public:
    RasterSurface(int width, int height);

    void set_fill_color(const Color& color, float alpha) override;
    void fill_rect(float x, float y, float w, float h) override;
    void set_stroke(const Color& color, float alpha, float line_width) override;
    void stroke_rect(float x, float y, float w, float h) override;

    const Raster& raster() const { return raster_; }
    Raster take_raster() { return std::move(raster_); }

private:
    struct Box {
        float x0, y0, x1, y1;
    };

    /// Blend `color` over every pixel touched by `outer` minus `inner`
    void paint(const Box& outer, const Box* inner, const Color& color, float alpha);
    void blend_pixel(int x, int y, const Color& color, float alpha);

    Raster raster_;
    Color fill_color_{0, 0, 0};
    float fill_alpha_ = 1.0f;
    Color stroke_color_{0, 0, 0};
    float stroke_alpha_ = 1.0f;
    float line_width_ = 1.0f;
};
