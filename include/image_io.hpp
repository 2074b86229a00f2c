#pragma once

#include <string>
#include "plate.hpp"

namespace platerec {

/**
 * @brief Load a PNG file as an 8-bit RGBA frame
 *
 * Palette, grayscale and 16-bit inputs are expanded by libpng; images
 * without alpha get an opaque alpha channel.
 *
 * @param png_path Path to PNG file
 * @param image Output frame (captured_at_ms is left untouched)
 * @return true if successful, false otherwise
 */
bool load_image_from_png(const std::string& png_path, CapturedImage& image);

} // namespace platerec
