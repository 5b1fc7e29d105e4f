#include <doctest/doctest.h>
#include <resampler/cpu/nearest.hh>
#include "test_common.hh"

using namespace resampler;

TEST_CASE("Nearest neighbor resampling") {
    const pixel_value red = pixel_value::from_rgb(255, 0, 0);
    const pixel_value green = pixel_value::from_rgb(0, 255, 0);

    SUBCASE("2x1 to 4x1 follows half-pixel centers") {
        pixel_buffer input(2, 1, 3);
        input.set_pixel(0, 0, red);
        input.set_pixel(1, 0, green);

        const auto output = resample_nearest(input, 4, 1, 1);

        REQUIRE(output.width() == 4);
        REQUIRE(output.height() == 1);
        CHECK(output.get_pixel(0, 0) == red);
        CHECK(output.get_pixel(1, 0) == red);
        CHECK(output.get_pixel(2, 0) == green);
        CHECK(output.get_pixel(3, 0) == green);
    }

    SUBCASE("Downscale picks the pixel under each output center") {
        // 4 -> 2: centers 1.0 and 3.0
        pixel_buffer input(4, 1, 3);
        for (index_t x = 0; x < 4; ++x) {
            const auto v = static_cast<std::uint8_t>(x * 10);
            input.set_pixel(x, 0, {v, v, v});
        }
        const auto output = resample_nearest(input, 2, 1, 1);
        CHECK(output.get_pixel(0, 0).g == 10);
        CHECK(output.get_pixel(1, 0).g == 30);
    }

    SUBCASE("Integer upscale replicates blocks") {
        const auto input = test::create_checkerboard(4);
        const auto output = resample_nearest(input, 12, 12, 1);
        for (index_t y = 0; y < 12; ++y) {
            for (index_t x = 0; x < 12; ++x) {
                CHECK(output.get_pixel(x, y) == input.get_pixel(x / 3, y / 3));
            }
        }
    }

    SUBCASE("Identity is exact") {
        const auto input = test::create_noise(13, 9);
        CHECK(resample_nearest(input, 13, 9, 1) == input);
    }

    SUBCASE("Only source values appear in the output") {
        const auto input = test::create_checkerboard(5, pixel_value::from_rgb(200, 10, 30),
                                                     pixel_value::from_rgb(5, 6, 7));
        const auto output = resample_nearest(input, 17, 3, 1);
        for (index_t y = 0; y < output.height(); ++y) {
            for (index_t x = 0; x < output.width(); ++x) {
                const auto p = output.get_pixel(x, y);
                CHECK((p == pixel_value::from_rgb(200, 10, 30) || p == pixel_value::from_rgb(5, 6, 7)));
            }
        }
    }

    SUBCASE("Single pixel fills any target") {
        const auto input = test::create_single_pixel(green);
        CHECK(test::is_constant(resample_nearest(input, 7, 3, 1), green));
    }

    SUBCASE("Padded source rows are read without their padding") {
        const auto input = test::create_noise(6, 4);
        const auto padded = test::with_row_padding(input, 7);
        CHECK(resample_nearest(padded, 11, 9, 1) == resample_nearest(input, 11, 9, 1));
    }
}
