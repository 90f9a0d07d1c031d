#include "image.hpp"
#include "pixel_art.hpp"

#include <cstdio>
#include <filesystem>
#include <iostream>
#include <string>

static void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " <image_path> [options]\n"
              << "\n"
              << "Pixel-art converter: downsample a picture onto a grid and reduce it to a\n"
              << "median-cut palette, then draw every cell as an outlined block.\n"
              << "\n"
              << "Options:\n"
              << "  --colors <24-256>    Palette size (default: 24)\n"
              << "  --size <20-200>      Longest grid side in cells (default: 80)\n"
              << "  --block <1-64>       Cell size in output pixels (default: 12)\n"
              << "  --no-grid            Do not outline the cells\n"
              << "  -o, --output <path>  Output PNG (default: pixel_<name>.png)\n"
              << "  --palette            Print the palette as hex colors\n"
              << "  --help               Show this help message\n";
}

static std::string default_output_path(const std::string& image_path) {
    std::filesystem::path p(image_path);
    return "pixel_" + p.stem().string() + ".png";
}

static std::string hex_color(const Color& c) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "#%02x%02x%02x", c.r, c.g, c.b);
    return buf;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    // Parse arguments
    std::string image_path;
    std::string output_path;
    ConvertOptions options;
    bool print_palette = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--colors" && i + 1 < argc) {
            options.color_count = parse_int_or(argv[++i], DEFAULT_COLOR_COUNT);
        } else if (arg == "--size" && i + 1 < argc) {
            options.max_size = parse_int_or(argv[++i], DEFAULT_GRID_SIZE);
        } else if (arg == "--block" && i + 1 < argc) {
            options.block_size = parse_int_or(argv[++i], DEFAULT_BLOCK_SIZE);
        } else if ((arg == "--output" || arg == "-o") && i + 1 < argc) {
            output_path = argv[++i];
        } else if (arg == "--no-grid") {
            options.draw_grid = false;
        } else if (arg == "--palette") {
            print_palette = true;
        } else if (arg[0] != '-') {
            image_path = arg;
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    if (image_path.empty()) {
        std::cerr << "Error: Please specify an image file." << std::endl;
        print_usage(argv[0]);
        return 1;
    }
    if (output_path.empty()) {
        output_path = default_output_path(image_path);
    }

    options = clamp_options(options);

    try {
        validate_image_file(image_path);

        std::cout << "Loading: " << image_path << std::endl;
        Raster source = load_image(image_path);
        std::cout << "Image:   " << source.width << "x" << source.height << std::endl;
        std::cout << "Options: colors=" << options.color_count << ", size=" << options.max_size
                  << ", block=" << options.block_size
                  << ", grid=" << (options.draw_grid ? "on" : "off") << std::endl;

        PixelArt art = convert_to_pixel_art(source, options);
        std::cout << "Grid:    " << art.width << "x" << art.height << std::endl;
        if (art.palette.empty()) {
            std::cout << "Palette: none (no visible pixels), using averaged colors" << std::endl;
        } else {
            std::cout << "Palette: " << art.palette.size() << " colors" << std::endl;
        }

        if (print_palette) {
            for (const auto& c : art.palette) {
                std::cout << hex_color(c) << "\n";
            }
        }

        Raster output = render_to_raster(art, options.block_size, options.draw_grid);
        save_png(output_path, output);
        std::cout << "Saved:   " << output_path << " (" << output.width << "x" << output.height
                  << ")" << std::endl;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
