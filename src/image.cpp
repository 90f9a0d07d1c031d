#define STB_IMAGE_IMPLEMENTATION
#define STB_IMAGE_RESIZE_IMPLEMENTATION
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include "stb_image.h"
#include "stb_image_resize2.h"
#include "stb_image_write.h"
#include "image.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstring>
#include <filesystem>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

static const std::array<const char*, 7> IMAGE_EXTENSIONS = {{
    ".jpg", ".jpeg", ".png", ".gif", ".bmp", ".webp", ".svg",
}};

static void check_raster(const Raster& raster) {
    if (raster.empty()) {
        throw std::invalid_argument("Raster has no pixels");
    }
    if (raster.pixels.size() != static_cast<size_t>(raster.width) * raster.height * 4) {
        throw std::invalid_argument("Raster buffer size does not match its dimensions");
    }
}

// --- Validation ---

bool has_image_extension(const std::string& path) {
    std::string name = path;
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (const char* ext : IMAGE_EXTENSIONS) {
        size_t len = std::strlen(ext);
        if (name.size() >= len && name.compare(name.size() - len, len, ext) == 0) {
            return true;
        }
    }
    return false;
}

void validate_image_file(const std::string& path) {
    if (!has_image_extension(path)) {
        throw std::runtime_error("Not a supported image file: " + path);
    }

    std::error_code ec;
    uintmax_t size = fs::file_size(path, ec);
    if (ec) {
        throw std::runtime_error("Cannot read " + path + " (" + ec.message() + ")");
    }
    if (size > MAX_IMAGE_FILE_BYTES) {
        std::ostringstream oss;
        oss.setf(std::ios::fixed);
        oss.precision(2);
        oss << "File " << path << " is too large (" << size / 1024.0 / 1024.0
            << "MB), at most 10MB is supported";
        throw std::runtime_error(oss.str());
    }
}

// --- Decoding ---

static Raster take_stbi_pixels(unsigned char* data, int w, int h) {
    std::unique_ptr<unsigned char, decltype(&stbi_image_free)> owned(data, stbi_image_free);
    Raster raster(w, h);
    std::memcpy(raster.pixels.data(), owned.get(), raster.pixels.size());
    return raster;
}

Raster load_image(const std::string& path) {
    int w, h, channels;
    unsigned char* data = stbi_load(path.c_str(), &w, &h, &channels, 4);  // Force RGBA
    if (!data) {
        throw std::runtime_error("Failed to load image: " + path +
                                 " (" + stbi_failure_reason() + ")");
    }
    return take_stbi_pixels(data, w, h);
}

Raster decode_image(const std::vector<uint8_t>& encoded) {
    if (encoded.empty()) {
        throw std::runtime_error("Failed to decode image: empty buffer");
    }
    int w, h, channels;
    unsigned char* data = stbi_load_from_memory(encoded.data(), static_cast<int>(encoded.size()),
                                                &w, &h, &channels, 4);
    if (!data) {
        throw std::runtime_error(std::string("Failed to decode image (") +
                                 stbi_failure_reason() + ")");
    }
    return take_stbi_pixels(data, w, h);
}

// --- Encoding ---

void save_png(const std::string& path, const Raster& raster) {
    check_raster(raster);
    int ok = stbi_write_png(path.c_str(), raster.width, raster.height, 4,
                            raster.pixels.data(), static_cast<int>(raster.stride()));
    if (!ok) {
        throw std::runtime_error("Failed to write PNG: " + path);
    }
}

static void append_bytes(void* context, void* data, int size) {
    auto* out = static_cast<std::vector<uint8_t>*>(context);
    auto* bytes = static_cast<const uint8_t*>(data);
    out->insert(out->end(), bytes, bytes + size);
}

std::vector<uint8_t> encode_png(const Raster& raster) {
    check_raster(raster);
    std::vector<uint8_t> out;
    int ok = stbi_write_png_to_func(append_bytes, &out, raster.width, raster.height, 4,
                                    raster.pixels.data(), static_cast<int>(raster.stride()));
    if (!ok) {
        throw std::runtime_error("PNG encoding failed");
    }
    return out;
}

// --- Resampling ---

Raster resize_raster(const Raster& src, int new_w, int new_h) {
    check_raster(src);
    if (new_w <= 0 || new_h <= 0) {
        throw std::invalid_argument("Resize target must be at least 1x1");
    }
    if (new_w == src.width && new_h == src.height) {
        return src;
    }

    Raster out(new_w, new_h);
    unsigned char* result = stbir_resize_uint8_linear(
        src.pixels.data(), src.width, src.height, static_cast<int>(src.stride()),
        out.pixels.data(), new_w, new_h, static_cast<int>(out.stride()),
        STBIR_RGBA);
    if (!result) {
        throw std::runtime_error("Image resampling failed");
    }
    return out;
}
