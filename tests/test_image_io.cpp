#include "image_io.hpp"
#include "cache.hpp"
#include "test_helpers.hpp"
#include <png.h>
#include <cstdio>
#include <fstream>

using namespace platerec;

namespace {

// Write `data` (tightly packed rows) as a PNG fixture
bool write_png(const std::string& path, uint32_t width, uint32_t height,
               int color_type, int bit_depth, const std::vector<uint8_t>& data)
{
    FILE* fp = fopen(path.c_str(), "wb");
    if (!fp) {
        return false;
    }

    png_structp png = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    png_infop info = png ? png_create_info_struct(png) : nullptr;
    if (!png || !info) {
        png_destroy_write_struct(&png, &info);
        fclose(fp);
        return false;
    }

    std::vector<png_bytep> rows(height);

    if (setjmp(png_jmpbuf(png))) {
        png_destroy_write_struct(&png, &info);
        fclose(fp);
        return false;
    }

    png_init_io(png, fp);
    png_set_IHDR(png, info, width, height, bit_depth, color_type,
                 PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_DEFAULT, PNG_FILTER_TYPE_DEFAULT);
    png_write_info(png, info);

    const size_t row_bytes = data.size() / height;
    for (uint32_t y = 0; y < height; ++y) {
        rows[y] = const_cast<png_bytep>(&data[y * row_bytes]);
    }

    png_write_image(png, rows.data());
    png_write_end(png, nullptr);
    png_destroy_write_struct(&png, &info);
    fclose(fp);
    return true;
}

bool pixel_is(const CapturedImage& image, uint32_t x, uint32_t y,
              uint8_t r, uint8_t g, uint8_t b, uint8_t a)
{
    const uint8_t* p = image.data() + (static_cast<size_t>(y) * image.width + x) * CapturedImage::CHANNELS;
    return p[0] == r && p[1] == g && p[2] == b && p[3] == a;
}

bool test_rgb_gets_opaque_alpha()
{
    const std::string path = "platerec_test_rgb.png";
    std::vector<uint8_t> rgb;
    for (uint32_t i = 0; i < 4 * 3; ++i) {
        rgb.push_back(static_cast<uint8_t>(i * 10));
        rgb.push_back(static_cast<uint8_t>(i * 10 + 1));
        rgb.push_back(static_cast<uint8_t>(i * 10 + 2));
    }
    CHECK(write_png(path, 4, 3, PNG_COLOR_TYPE_RGB, 8, rgb));

    CapturedImage image;
    image.captured_at_ms = 77;
    CHECK(load_image_from_png(path, image));
    CHECK(image.is_valid());
    CHECK_EQ(image.width, 4u);
    CHECK_EQ(image.height, 3u);
    CHECK_EQ(image.captured_at_ms, 77);
    CHECK(pixel_is(image, 0, 0, 0, 1, 2, 255));
    CHECK(pixel_is(image, 1, 0, 10, 11, 12, 255));
    CHECK(pixel_is(image, 3, 2, 110, 111, 112, 255));

    std::remove(path.c_str());
    return true;
}

bool test_gray16_is_expanded()
{
    const std::string path = "platerec_test_gray16.png";
    std::vector<uint8_t> gray;   // Big-endian samples
    for (int i = 0; i < 2 * 2; ++i) {
        gray.push_back(0xAB);
        gray.push_back(0xCD);
    }
    CHECK(write_png(path, 2, 2, PNG_COLOR_TYPE_GRAY, 16, gray));

    CapturedImage image;
    CHECK(load_image_from_png(path, image));
    CHECK_EQ(image.byte_count(), 2u * 2u * 4u);
    CHECK(pixel_is(image, 1, 1, 0xAB, 0xAB, 0xAB, 255));

    std::remove(path.c_str());
    return true;
}

bool test_gray_alpha_keeps_alpha()
{
    const std::string path = "platerec_test_gray_alpha.png";
    const std::vector<uint8_t> data = {40, 128, 200, 255};
    CHECK(write_png(path, 2, 1, PNG_COLOR_TYPE_GRAY_ALPHA, 8, data));

    CapturedImage image;
    CHECK(load_image_from_png(path, image));
    CHECK(pixel_is(image, 0, 0, 40, 40, 40, 128));
    CHECK(pixel_is(image, 1, 0, 200, 200, 200, 255));

    std::remove(path.c_str());
    return true;
}

bool test_encodings_share_hash()
{
    const std::string rgb_path = "platerec_test_same_rgb.png";
    const std::string rgba_path = "platerec_test_same_rgba.png";

    std::vector<uint8_t> rgb;
    std::vector<uint8_t> rgba;
    for (int i = 0; i < 8 * 8; ++i) {
        const uint8_t v = static_cast<uint8_t>(i * 3);
        rgb.insert(rgb.end(), {v, static_cast<uint8_t>(255 - v), 7});
        rgba.insert(rgba.end(), {v, static_cast<uint8_t>(255 - v), 7, 255});
    }
    CHECK(write_png(rgb_path, 8, 8, PNG_COLOR_TYPE_RGB, 8, rgb));
    CHECK(write_png(rgba_path, 8, 8, PNG_COLOR_TYPE_RGB_ALPHA, 8, rgba));

    CapturedImage a;
    CapturedImage b;
    CHECK(load_image_from_png(rgb_path, a));
    CHECK(load_image_from_png(rgba_path, b));
    CHECK_EQ(compute_image_hash(a), compute_image_hash(b));

    std::remove(rgb_path.c_str());
    std::remove(rgba_path.c_str());
    return true;
}

bool test_rejects_bad_files()
{
    CapturedImage image;
    CHECK(!load_image_from_png("platerec_no_such_image.png", image));

    const std::string path = "platerec_test_not_png.png";
    {
        std::ofstream ofs(path);
        ofs << "this is not an image";
    }
    CHECK(!load_image_from_png(path, image));
    CHECK(!image.is_valid());

    std::remove(path.c_str());
    return true;
}

} // anonymous namespace

int main()
{
    return platerec_test::run_tests("image io", {
        {"rgb gets opaque alpha", test_rgb_gets_opaque_alpha},
        {"gray16 is expanded", test_gray16_is_expanded},
        {"gray alpha keeps alpha", test_gray_alpha_keeps_alpha},
        {"encodings share hash", test_encodings_share_hash},
        {"rejects bad files", test_rejects_bad_files},
    });
}
