#pragma once

#include <cstdint>
#include <string>
#include <vector>

/// Largest input file accepted by validate_image_file (10 MiB)
static const uintmax_t MAX_IMAGE_FILE_BYTES = 10 * 1024 * 1024;

/// RGBA8 pixel buffer, row-major, no padding (width * height * 4 bytes)
struct Raster {
    int width = 0;
    int height = 0;
    std::vector<uint8_t> pixels;

    Raster() = default;
    Raster(int w, int h) : width(w), height(h), pixels(static_cast<size_t>(w) * h * 4, 0) {}

    bool empty() const { return width <= 0 || height <= 0; }
    size_t stride() const { return static_cast<size_t>(width) * 4; }

    uint8_t* at(int x, int y) { return &pixels[(static_cast<size_t>(y) * width + x) * 4]; }
    const uint8_t* at(int x, int y) const { return &pixels[(static_cast<size_t>(y) * width + x) * 4]; }
};

/// Reject files that are not images by extension or are larger than MAX_IMAGE_FILE_BYTES.
/// Throws std::runtime_error describing the problem.
void validate_image_file(const std::string& path);

/// Whether the file name ends in one of the accepted image extensions (case-insensitive)
bool has_image_extension(const std::string& path);

/// Decode an image file into an RGBA raster
Raster load_image(const std::string& path);

/// Decode an encoded image held in memory into an RGBA raster
Raster decode_image(const std::vector<uint8_t>& encoded);

/// Write a raster to disk as PNG
void save_png(const std::string& path, const Raster& raster);

/// Encode a raster as PNG into memory
std::vector<uint8_t> encode_png(const Raster& raster);

/// Smooth (antialiased) resample to new_w x new_h, straight alpha.
/// Same-size requests return an unchanged copy.
Raster resize_raster(const Raster& src, int new_w, int new_h);
