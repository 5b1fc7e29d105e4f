/**
 * @file unified_resampler.hh
 * @brief Single entry point for resampling pixel buffers
 *
 * This header validates requests, short-circuits degenerate cases and
 * dispatches to the nearest neighbor, bilinear and bicubic resamplers. It
 * supports both returning a new buffer and writing into a preallocated one.
 *
 * @example Basic usage:
 * @code
 * // Enlarge a BGR image to 640x480 with Catmull-Rom, on all cores
 * auto scaled = resampler::unified_resampler::scale(
 *     input, 640, 480, resampler::interpolation_mode::Bicubic
 * );
 *
 * // Scale into a preallocated buffer (size taken from the buffer), 4 workers
 * resampler::pixel_buffer output(320, 240, 3);
 * resampler::unified_resampler::scale(
 *     input, output, resampler::interpolation_mode::Bilinear, 4
 * );
 * @endcode
 *
 * @note All methods are stateless and thread-safe. Each call allocates its
 *       own tables and intermediate buffers.
 * @note Shrinking samples the source without prefiltering in every mode, so
 *       minification looks close to nearest neighbor.
 * @see interpolation.hh for available modes
 * @see mode_capabilities.hh for querying mode properties
 */
#pragma once

#include <stdexcept>
#include <cstddef>
#include <cstdint>
#include <algorithm>

#include <resampler/exceptions.hh>
#include <resampler/interpolation.hh>
#include <resampler/mode_capabilities.hh>
#include <resampler/pixel_buffer.hh>
#include <resampler/types.hh>
#include <resampler/warning_macros.hh>

#include <resampler/cpu/row_parallel.hh>
#include <resampler/cpu/nearest.hh>
#include <resampler/cpu/bilinear.hh>
#include <resampler/cpu/bicubic.hh>

namespace resampler {

    /**
     * @class unified_resampler
     * @brief Validation and dispatch for all interpolation modes
     */
    class unified_resampler {
        public:
            /**
             * @brief Scale a buffer to a new size
             *
             * @param source Buffer to read; never modified
             * @param target_width Output width in pixels
             * @param target_height Output height in pixels
             * @param mode Interpolation mode; unknown values fall back to NearestNeighbor
             * @param parallelism Maximum number of row workers; 0 uses default_parallelism()
             * @return Newly allocated, tightly packed 3-byte buffer
             * @throws invalid_format_exception if source is not 3 bytes per pixel
             * @throws invalid_target_size_exception if a target dimension is zero
             */
            static pixel_buffer scale(const pixel_buffer& source,
                                      dimension_t target_width,
                                      dimension_t target_height,
                                      interpolation_mode mode,
                                      std::size_t parallelism = 0) {
                const interpolation_mode effective = resolve_mode(mode);
                validate_source(source, effective);
                validate_target(dim_to_coord(target_width), dim_to_coord(target_height));

                pixel_buffer result(target_width, target_height, source.bytes_per_pixel());
                dispatch_into(source, result, effective, parallelism);
                return result;
            }

            /**
             * @brief Scale a buffer to a new size given as a target_size
             */
            static pixel_buffer scale(const pixel_buffer& source,
                                      target_size size,
                                      interpolation_mode mode,
                                      std::size_t parallelism = 0) {
                return scale(source, size.width, size.height, mode, parallelism);
            }

            /**
             * @brief Scale into a preallocated target; the target size is the output size
             *
             * @throws invalid_format_exception if source or target is not 3 bytes per pixel
             * @throws invalid_target_size_exception if the target has a zero dimension
             * @throws std::invalid_argument if target and source are the same buffer
             */
            static void scale(const pixel_buffer& source,
                              pixel_buffer& target,
                              interpolation_mode mode,
                              std::size_t parallelism = 0) {
                const interpolation_mode effective = resolve_mode(mode);
                validate_source(source, effective);
                if (!mode_capabilities::is_format_supported(effective, target.bytes_per_pixel())) {
                    throw invalid_format_exception(effective, target.bytes_per_pixel(),
                                                   mode_capabilities::required_bytes_per_pixel(effective));
                }
                validate_target(dim_to_coord(target.width()), dim_to_coord(target.height()));
                if (&source == &target) {
                    throw std::invalid_argument("Resampling target must be a different buffer than its source");
                }

                dispatch_into(source, target, effective, parallelism);
            }

            /**
             * @brief Convert a signed caller-supplied size to a target_size
             * @throws invalid_target_size_exception if width or height is not positive
             */
            static target_size checked_target_size(coord_t width, coord_t height) {
                validate_target(width, height);
                return {static_cast<dimension_t>(width), static_cast<dimension_t>(height)};
            }

            /**
             * @brief Largest size with the aspect ratio of source that fits inside bounds
             *
             * The limiting axis matches bounds exactly, the other is truncated
             * (never below 1 pixel).
             *
             * @throws invalid_target_size_exception if source or bounds has a zero dimension
             */
            static target_size fit_within(target_size source, target_size bounds) {
                validate_target(dim_to_coord(source.width), dim_to_coord(source.height));
                validate_target(dim_to_coord(bounds.width), dim_to_coord(bounds.height));

                const float x_ratio = RESAMPLER_SIZE_TO_FLOAT(bounds.width) / RESAMPLER_SIZE_TO_FLOAT(source.width);
                const float y_ratio = RESAMPLER_SIZE_TO_FLOAT(bounds.height) / RESAMPLER_SIZE_TO_FLOAT(source.height);
                const float ratio = x_ratio < y_ratio ? x_ratio : y_ratio;

                auto fit = [ratio](dimension_t extent, dimension_t limit) {
                    const auto scaled = static_cast<dimension_t>(ratio * RESAMPLER_SIZE_TO_FLOAT(extent));
                    return clamp_index(scaled == 0 ? 1 : scaled, limit);
                };
                return {fit(source.width, bounds.width), fit(source.height, bounds.height)};
            }

        private:
            static interpolation_mode resolve_mode(interpolation_mode mode) noexcept {
                switch (mode) {
                    case interpolation_mode::NearestNeighbor:
                    case interpolation_mode::Bilinear:
                    case interpolation_mode::Bicubic:
                        return mode;
                    default:
                        return interpolation_mode::NearestNeighbor;
                }
            }

            static void validate_source(const pixel_buffer& source, interpolation_mode mode) {
                if (!mode_capabilities::is_format_supported(mode, source.bytes_per_pixel())) {
                    throw invalid_format_exception(mode, source.bytes_per_pixel(),
                                                   mode_capabilities::required_bytes_per_pixel(mode));
                }
            }

            static void validate_target(coord_t width, coord_t height) {
                if (width <= 0 || height <= 0) {
                    throw invalid_target_size_exception(width, height);
                }
            }

            // An empty source has no sample to map; the result is a zero-filled target
            static void dispatch_into(const pixel_buffer& source, pixel_buffer& target,
                                      interpolation_mode mode, std::size_t parallelism) {
                if (source.width() == 0 || source.height() == 0) {
                    for (index_t y = 0; y < target.height(); ++y) {
                        const auto row = target.row(y);
                        std::fill(row.begin(), row.end(), std::uint8_t{0});
                    }
                    return;
                }

                switch (mode) {
                    case interpolation_mode::Bilinear:
                        resample_bilinear_into(source, target, parallelism);
                        break;

                    case interpolation_mode::Bicubic:
                        resample_bicubic_into(source, target, parallelism);
                        break;

                    case interpolation_mode::NearestNeighbor:
                    default:
                        resample_nearest_into(source, target, parallelism);
                        break;
                }
            }
    };

} // namespace resampler
