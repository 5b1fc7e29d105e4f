#include <doctest/doctest.h>
#include <resampler/unified_resampler.hh>
#include "test_common.hh"
#include <stdexcept>
#include <string>

using namespace resampler;

TEST_CASE("Unified Resampler Interface") {
    const auto input = test::create_noise(8, 6);

    SUBCASE("Every mode produces the requested size") {
        for (interpolation_mode mode : mode_capabilities::get_all_modes()) {
            const auto output = unified_resampler::scale(input, 19, 4, mode);
            CHECK(output.width() == 19);
            CHECK(output.height() == 4);
            CHECK(output.bytes_per_pixel() == 3);
            CHECK(output.stride() == 19 * 3);
        }
    }

    SUBCASE("Identity holds in every mode") {
        for (interpolation_mode mode : mode_capabilities::get_all_modes()) {
            CHECK(unified_resampler::scale(input, 8, 6, mode, 2) == input);
        }
    }

    SUBCASE("target_size overload matches width and height overload") {
        const target_size size{13, 9};
        CHECK(unified_resampler::scale(input, size, interpolation_mode::Bicubic, 1) ==
              unified_resampler::scale(input, 13, 9, interpolation_mode::Bicubic, 1));
    }

    SUBCASE("Aliases select the same kernels") {
        CHECK(unified_resampler::scale(input, 5, 5, interpolation_mode::CatmullRom) ==
              unified_resampler::scale(input, 5, 5, interpolation_mode::Bicubic));
        CHECK(unified_resampler::scale(input, 5, 5, interpolation_mode::Nearest) ==
              unified_resampler::scale(input, 5, 5, interpolation_mode::NearestNeighbor));
    }

    SUBCASE("Unknown mode falls back to nearest neighbor") {
        const auto unknown = static_cast<interpolation_mode>(42);
        CHECK(unified_resampler::scale(input, 17, 3, unknown) ==
              unified_resampler::scale(input, 17, 3, interpolation_mode::NearestNeighbor));
    }

    SUBCASE("Source is left untouched") {
        const pixel_buffer before = input;
        (void)unified_resampler::scale(input, 30, 30, interpolation_mode::Bilinear);
        CHECK(input == before);
    }
}

TEST_CASE("Unified Resampler validation") {
    SUBCASE("4-byte source is rejected with InvalidFormat") {
        const pixel_buffer bgra(4, 4, 4);
        for (interpolation_mode mode : mode_capabilities::get_all_modes()) {
            try {
                (void)unified_resampler::scale(bgra, 8, 8, mode);
                FAIL("expected invalid_format_exception");
            } catch (const invalid_format_exception& e) {
                CHECK(e.m_mode == mode);
                CHECK(e.m_bytes_per_pixel == 4);
                CHECK(e.m_required_bytes_per_pixel == 3);
                CHECK(std::string(e.what()).find(mode_capabilities::get_mode_name(mode)) != std::string::npos);
            }
        }
    }

    SUBCASE("Zero target dimension is rejected") {
        const auto input = test::create_noise(4, 4);
        CHECK_THROWS_AS((void)unified_resampler::scale(input, 0, 4, interpolation_mode::Bilinear),
                        invalid_target_size_exception);
        CHECK_THROWS_AS((void)unified_resampler::scale(input, 4, 0, interpolation_mode::Bicubic),
                        invalid_target_size_exception);
        CHECK_THROWS_AS((void)unified_resampler::scale(input, target_size{0, 0}, interpolation_mode::Nearest),
                        std::invalid_argument);

        try {
            (void)unified_resampler::scale(input, 7, 0, interpolation_mode::Bicubic);
            FAIL("expected invalid_target_size_exception");
        } catch (const invalid_target_size_exception& e) {
            CHECK(e.m_width == 7);
            CHECK(e.m_height == 0);
        }
    }

    SUBCASE("Format is checked before size") {
        const pixel_buffer bgra(4, 4, 4);
        CHECK_THROWS_AS((void)unified_resampler::scale(bgra, 0, 0, interpolation_mode::Bilinear),
                        invalid_format_exception);
    }

    SUBCASE("Signed sizes are validated") {
        CHECK_THROWS_AS(unified_resampler::checked_target_size(-3, 5), invalid_target_size_exception);
        CHECK_THROWS_AS(unified_resampler::checked_target_size(5, -1), invalid_target_size_exception);
        CHECK_THROWS_AS(unified_resampler::checked_target_size(0, 1), invalid_target_size_exception);
        CHECK(unified_resampler::checked_target_size(640, 480) == target_size{640, 480});

        try {
            (void)unified_resampler::checked_target_size(-3, 5);
            FAIL("expected invalid_target_size_exception");
        } catch (const invalid_target_size_exception& e) {
            CHECK(e.m_width == -3);
            CHECK(e.m_height == 5);
        }
    }

    SUBCASE("Empty source yields a zero-filled target") {
        const pixel_buffer empty(0, 0, 3);
        for (interpolation_mode mode : mode_capabilities::get_all_modes()) {
            const auto output = unified_resampler::scale(empty, 3, 2, mode);
            CHECK(output.width() == 3);
            CHECK(output.height() == 2);
            CHECK(test::is_constant(output, pixel_value(0, 0, 0)));
        }
    }
}

TEST_CASE("Unified Resampler preallocated target") {
    const auto input = test::create_noise(9, 7);

    SUBCASE("Matches the allocating overload") {
        for (interpolation_mode mode : mode_capabilities::get_all_modes()) {
            pixel_buffer output(20, 15, 3);
            unified_resampler::scale(input, output, mode, 3);
            CHECK(output == unified_resampler::scale(input, 20, 15, mode, 1));
        }
    }

    SUBCASE("Row padding of the target is not written") {
        for (interpolation_mode mode : mode_capabilities::get_all_modes()) {
            pixel_buffer output = test::with_row_padding(pixel_buffer(14, 5, 3), 6);
            unified_resampler::scale(input, output, mode);

            for (index_t y = 0; y < output.height(); ++y) {
                const std::uint8_t* line = output.data() + y * output.stride();
                for (index_t i = output.row_bytes(); i < output.stride(); ++i) {
                    CHECK(line[i] == 0xCD);
                }
            }
            CHECK(output == unified_resampler::scale(input, 14, 5, mode));
        }
    }

    SUBCASE("Empty source clears the target rows") {
        const pixel_buffer empty(0, 0, 3);
        for (interpolation_mode mode : mode_capabilities::get_all_modes()) {
            pixel_buffer output = test::with_row_padding(
                test::create_solid_color(2, 2, pixel_value(9, 9, 9)), 4);
            unified_resampler::scale(empty, output, mode);

            CHECK(test::is_constant(output, pixel_value(0, 0, 0)));
            CHECK(output == unified_resampler::scale(empty, 2, 2, mode));
            for (index_t y = 0; y < output.height(); ++y) {
                const std::uint8_t* line = output.data() + y * output.stride();
                for (index_t i = output.row_bytes(); i < output.stride(); ++i) {
                    CHECK(line[i] == 0xCD);
                }
            }
        }
    }

    SUBCASE("4-byte target is rejected") {
        pixel_buffer output(10, 10, 4);
        CHECK_THROWS_AS(unified_resampler::scale(input, output, interpolation_mode::Bilinear),
                        invalid_format_exception);
    }

    SUBCASE("Empty target is rejected") {
        pixel_buffer output(0, 3, 3);
        CHECK_THROWS_AS(unified_resampler::scale(input, output, interpolation_mode::Bilinear),
                        invalid_target_size_exception);
    }

    SUBCASE("Source and target must differ") {
        pixel_buffer same = input;
        CHECK_THROWS_AS(unified_resampler::scale(same, same, interpolation_mode::Bicubic),
                        std::invalid_argument);
    }
}

TEST_CASE("fit_within") {
    CHECK(unified_resampler::fit_within({200, 100}, {50, 50}) == target_size{50, 25});
    CHECK(unified_resampler::fit_within({100, 100}, {30, 20}) == target_size{20, 20});
    CHECK(unified_resampler::fit_within({64, 32}, {256, 256}) == target_size{256, 128});
    CHECK(unified_resampler::fit_within({1024, 2}, {16, 16}) == target_size{16, 1});

    const target_size fitted = unified_resampler::fit_within({333, 777}, {100, 100});
    CHECK(fitted.width <= 100);
    CHECK(fitted.height >= 99);
    CHECK(fitted.height <= 100);

    CHECK_THROWS_AS(unified_resampler::fit_within({0, 10}, {10, 10}), invalid_target_size_exception);
    CHECK_THROWS_AS(unified_resampler::fit_within({10, 10}, {10, 0}), invalid_target_size_exception);
}

TEST_CASE("Mode capabilities") {
    SUBCASE("Database entries") {
        const auto& bicubic = mode_capabilities::get_info(interpolation_mode::Bicubic);
        CHECK(bicubic.name == "Bicubic");
        CHECK(bicubic.taps_per_axis == 4);
        CHECK(bicubic.separable);

        CHECK(mode_capabilities::get_info(interpolation_mode::Bilinear).taps_per_axis == 2);
        CHECK(mode_capabilities::get_info(interpolation_mode::NearestNeighbor).taps_per_axis == 1);
        CHECK_FALSE(mode_capabilities::get_info(interpolation_mode::NearestNeighbor).separable);

        for (interpolation_mode mode : mode_capabilities::get_all_modes()) {
            CHECK(mode_capabilities::is_format_supported(mode, 3));
            CHECK_FALSE(mode_capabilities::is_format_supported(mode, 4));
            CHECK(mode_capabilities::required_bytes_per_pixel(mode) == 3);
            CHECK_FALSE(mode_capabilities::get_mode_description(mode).empty());
        }
    }

    SUBCASE("Unknown mode has no formats") {
        const auto unknown = static_cast<interpolation_mode>(42);
        CHECK(mode_capabilities::get_mode_name(unknown) == "Unknown");
        CHECK(mode_capabilities::required_bytes_per_pixel(unknown) == 0);
        CHECK_FALSE(mode_capabilities::is_format_supported(unknown, 3));
    }

    SUBCASE("Names parse back to their modes") {
        for (interpolation_mode mode : mode_capabilities::get_all_modes()) {
            const auto parsed = mode_capabilities::parse_mode_name(mode_capabilities::get_mode_name(mode));
            REQUIRE(parsed.has_value());
            CHECK(*parsed == mode);
        }

        CHECK(mode_capabilities::parse_mode_name("BILINEAR") == interpolation_mode::Bilinear);
        CHECK(mode_capabilities::parse_mode_name("nn") == interpolation_mode::NearestNeighbor);
        CHECK(mode_capabilities::parse_mode_name("Nearest") == interpolation_mode::NearestNeighbor);
        CHECK(mode_capabilities::parse_mode_name("Catmull-Rom") == interpolation_mode::Bicubic);
        CHECK_FALSE(mode_capabilities::parse_mode_name("lanczos").has_value());
        CHECK_FALSE(mode_capabilities::parse_mode_name("").has_value());
    }
}
