#pragma once

#include <cstdint>
#include <iostream>
#include <string>
#include <utility>
#include <vector>
#include "plate.hpp"

// Fails the enclosing bool test function with the location of the check
#define CHECK(cond) \
    do { \
        if (!(cond)) { \
            std::cerr << "  CHECK FAILED: " #cond " (" << __FILE__ << ":" << __LINE__ << ")" << std::endl; \
            return false; \
        } \
    } while (0)

#define CHECK_EQ(a, b) \
    do { \
        if (!((a) == (b))) { \
            std::cerr << "  CHECK FAILED: " #a " == " #b " (" << (a) << " vs " << (b) << ") (" \
                      << __FILE__ << ":" << __LINE__ << ")" << std::endl; \
            return false; \
        } \
    } while (0)

namespace platerec_test {

typedef bool (*TestFn)();

struct TestCase {
    const char* name;
    TestFn fn;
};

inline int run_tests(const char* suite, const std::vector<TestCase>& tests)
{
    std::cout << "Running " << suite << " (" << tests.size() << " tests)" << std::endl;

    int failed = 0;
    for (const auto& test : tests) {
        const bool ok = test.fn();
        std::cout << (ok ? "[PASS] " : "[FAIL] ") << test.name << std::endl;
        if (!ok) {
            failed++;
        }
    }

    std::cout << suite << ": " << (tests.size() - failed) << "/" << tests.size() << " passed" << std::endl;
    return failed == 0 ? 0 : 1;
}

/**
 * 8 px vertical stripes alternating between two gray levels. At 640x480 with
 * levels 60/190 the frame is sharp, evenly lit and axis aligned.
 */
inline platerec::CapturedImage make_striped_image(uint32_t width = 640, uint32_t height = 480,
                                                  uint8_t dark = 60, uint8_t light = 190,
                                                  uint32_t phase = 0)
{
    std::vector<uint8_t> rgba(static_cast<size_t>(width) * height * 4);
    for (uint32_t y = 0; y < height; ++y) {
        for (uint32_t x = 0; x < width; ++x) {
            const uint8_t v = (((x + phase) / 8) % 2 == 0) ? dark : light;
            uint8_t* px = &rgba[(static_cast<size_t>(y) * width + x) * 4];
            px[0] = v;
            px[1] = v;
            px[2] = v;
            px[3] = 255;
        }
    }
    return platerec::CapturedImage(std::move(rgba), width, height);
}

inline platerec::CapturedImage make_uniform_image(uint32_t width, uint32_t height, uint8_t level)
{
    std::vector<uint8_t> rgba(static_cast<size_t>(width) * height * 4, level);
    for (size_t i = 3; i < rgba.size(); i += 4) {
        rgba[i] = 255;
    }
    return platerec::CapturedImage(std::move(rgba), width, height);
}

inline platerec::PlateResult make_plate(const std::string& serial = "1234", int confidence = 95)
{
    return platerec::make_plate_result("品川", "330", "あ", serial, confidence,
                                       platerec::PlateCategory::REGULAR, 0);
}

} // namespace platerec_test
