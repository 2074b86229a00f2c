/**
 * @file image_io.cpp
 * @brief PNG decoding into RGBA frames
 */

#include "image_io.hpp"
#include <png.h>
#include <cstdio>
#include <iostream>
#include <utility>
#include <vector>

namespace platerec {

namespace {

/**
 * @brief Decode an opened PNG stream into 8-bit RGBA
 *
 * Buffers belong to the caller so nothing with a destructor lives in the
 * frame that libpng may longjmp out of.
 */
bool decode_rgba(png_structp png, png_infop info, FILE* fp,
                 std::vector<uint8_t>& rgba, std::vector<png_bytep>& row_pointers,
                 uint32_t& width, uint32_t& height)
{
    if (setjmp(png_jmpbuf(png))) {
        return false;
    }

    png_init_io(png, fp);
    png_set_sig_bytes(png, 8);
    png_read_info(png, info);

    width = png_get_image_width(png, info);
    height = png_get_image_height(png, info);
    const int bit_depth = png_get_bit_depth(png, info);
    const int color_type = png_get_color_type(png, info);

    // Normalize every input layout to 8-bit RGBA
    if (bit_depth == 16) {
        png_set_strip_16(png);
    }
    if (color_type == PNG_COLOR_TYPE_PALETTE) {
        png_set_palette_to_rgb(png);
    }
    if (color_type == PNG_COLOR_TYPE_GRAY && bit_depth < 8) {
        png_set_expand_gray_1_2_4_to_8(png);
    }
    if (png_get_valid(png, info, PNG_INFO_tRNS)) {
        png_set_tRNS_to_alpha(png);
    }
    if (color_type == PNG_COLOR_TYPE_GRAY || color_type == PNG_COLOR_TYPE_GRAY_ALPHA) {
        png_set_gray_to_rgb(png);
    }
    if (color_type == PNG_COLOR_TYPE_RGB || color_type == PNG_COLOR_TYPE_GRAY
        || color_type == PNG_COLOR_TYPE_PALETTE) {
        png_set_filler(png, 0xFF, PNG_FILLER_AFTER);
    }

    png_read_update_info(png, info);

    const size_t row_bytes = png_get_rowbytes(png, info);
    if (row_bytes != static_cast<size_t>(width) * CapturedImage::CHANNELS) {
        return false;
    }

    rgba.resize(row_bytes * height);
    row_pointers.resize(height);

    for (uint32_t y = 0; y < height; ++y) {
        row_pointers[y] = &rgba[y * row_bytes];
    }

    png_read_image(png, row_pointers.data());
    png_read_end(png, nullptr);
    return true;
}

} // anonymous namespace

bool load_image_from_png(const std::string& png_path, CapturedImage& image)
{
    FILE* fp = fopen(png_path.c_str(), "rb");
    if (!fp) {
        std::cerr << "Failed to open PNG: " << png_path << std::endl;
        return false;
    }

    png_byte signature[8];
    if (fread(signature, 1, sizeof(signature), fp) != sizeof(signature)
        || png_sig_cmp(signature, 0, sizeof(signature)) != 0) {
        std::cerr << "Not a PNG file: " << png_path << std::endl;
        fclose(fp);
        return false;
    }

    png_structp png = png_create_read_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    if (!png) {
        fclose(fp);
        return false;
    }

    png_infop info = png_create_info_struct(png);
    if (!info) {
        png_destroy_read_struct(&png, nullptr, nullptr);
        fclose(fp);
        return false;
    }

    std::vector<uint8_t> rgba;
    std::vector<png_bytep> row_pointers;
    uint32_t width = 0;
    uint32_t height = 0;

    const bool decoded = decode_rgba(png, info, fp, rgba, row_pointers, width, height);

    png_destroy_read_struct(&png, &info, nullptr);
    fclose(fp);

    if (!decoded) {
        std::cerr << "Failed to decode PNG: " << png_path << std::endl;
        return false;
    }

    const int64_t captured_at_ms = image.captured_at_ms;
    image = CapturedImage(std::move(rgba), width, height, captured_at_ms);

    return true;
}

} // namespace platerec
