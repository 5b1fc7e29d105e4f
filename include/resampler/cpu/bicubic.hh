#pragma once

#include <resampler/compiler_compat.hh>
#include <resampler/cpu/clamp.hh>
#include <resampler/cpu/row_parallel.hh>
#include <resampler/pixel_buffer.hh>
#include <resampler/types.hh>
#include <resampler/warning_macros.hh>
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>

namespace resampler {

    /**
     * Cubic convolution kernel, b = 0, c = 0.5 (Catmull-Rom)
     *
     * @param x Distance between a source sample centre and the mapped output centre
     * @return Tap weight; zero outside [-2, 2]
     */
    inline float catmull_rom_kernel(float x) noexcept {
        const float ax = std::fabs(x);
        const float ax2 = ax * ax;
        const float ax3 = ax2 * ax;

        if (ax <= 1.0f) {
            return 1.5f * ax3 - 2.5f * ax2 + 1.0f;
        }
        if (ax <= 2.0f) {
            return -0.5f * ax3 + 2.5f * ax2 - 4.0f * ax + 2.0f;
        }
        return 0.0f;
    }

    /**
     * Precomputed taps for one axis of one bicubic pass.
     *
     * For output coordinate i, indices[i*4 .. i*4+4) are the source samples
     * (clamped to the axis) and weights[i*4 .. i*4+4) their normalised weights.
     * Built once per pass, then only read.
     */
    struct weight_table {
        static constexpr dimension_t taps = 4;

        std::vector<index_t> indices;
        std::vector<float> weights;

        [[nodiscard]] dimension_t extent() const noexcept {
            return indices.size() / taps;
        }
    };

    /**
     * Build the tap table mapping in_extent source samples to out_extent outputs.
     *
     * The first tap is round(max(center - 2, 0)) with ties to even; the other
     * three follow it and are clamped to the last source index. A tap that
     * clamping collapsed onto its predecessor gets weight 0, then the four
     * weights are normalised to sum to 1.
     */
    inline weight_table build_weight_table(dimension_t in_extent, dimension_t out_extent) {
        constexpr dimension_t n = weight_table::taps;

        weight_table table;
        table.indices.resize(out_extent * n);
        table.weights.resize(out_extent * n);

        const float ratio = RESAMPLER_SIZE_TO_FLOAT(in_extent) / RESAMPLER_SIZE_TO_FLOAT(out_extent);
        const index_t last = in_extent - 1;

        for (index_t out = 0; out < out_extent; ++out) {
            const float center = (RESAMPLER_SIZE_TO_FLOAT(out) + 0.5f) * ratio;
            const auto first = static_cast<index_t>(std::nearbyint(std::max(center - 2.0f, 0.0f)));

            index_t idx[n];
            float w[n];
            for (index_t t = 0; t < n; ++t) {
                idx[t] = clamp_index(first + t, last);
                w[t] = catmull_rom_kernel(RESAMPLER_SIZE_TO_FLOAT(idx[t]) + 0.5f - center);
            }
            for (index_t t = 1; t < n; ++t) {
                if (idx[t] == idx[t - 1]) {
                    w[t] = 0.0f;
                }
            }

            const float sum = w[0] + w[1] + w[2] + w[3];
            if (RESAMPLER_UNLIKELY(std::fabs(sum) < 1e-6f)) {
                // Degenerate tap set: sample the source pixel nearest to center
                const index_t nearest = clamp_index(static_cast<index_t>(center), last);
                for (index_t t = 0; t < n; ++t) {
                    idx[t] = nearest;
                    w[t] = t == 0 ? 1.0f : 0.0f;
                }
            } else {
                const float normaliser = 1.0f / sum;
                for (index_t t = 0; t < n; ++t) {
                    w[t] *= normaliser;
                }
            }

            for (index_t t = 0; t < n; ++t) {
                table.indices[out * n + t] = idx[t];
                table.weights[out * n + t] = w[t];
            }
        }

        return table;
    }

    /**
     * Horizontal bicubic pass: every row of src resampled to dst.width().
     * dst.height() == src.height().
     */
    inline void bicubic_horizontal_pass(const pixel_buffer& src, pixel_buffer& dst,
                                        std::size_t parallelism) {
        constexpr dimension_t bpp = 3;
        constexpr dimension_t n = weight_table::taps;
        RESAMPLER_DEBUG_ASSERT(src.height() == dst.height());

        const dimension_t dst_width = dst.width();
        const weight_table table = build_weight_table(src.width(), dst_width);

        for_each_row_parallel(dst, parallelism, [&](byte_span out_row, index_t y) {
            const const_byte_span in_row = src.row(y);
            const index_t* cols = table.indices.data();
            const float* weights = table.weights.data();

            index_t o = 0;
            for (index_t x = 0; x < dst_width; ++x, o += bpp, cols += n, weights += n) {
                const index_t c1 = cols[0] * bpp;
                const index_t c2 = cols[1] * bpp;
                const index_t c3 = cols[2] * bpp;
                const index_t c4 = cols[3] * bpp;

                for (index_t ch = 0; ch < bpp; ++ch) {
                    const float v = static_cast<float>(in_row[c1 + ch]) * weights[0]
                                  + static_cast<float>(in_row[c2 + ch]) * weights[1]
                                  + static_cast<float>(in_row[c3 + ch]) * weights[2]
                                  + static_cast<float>(in_row[c4 + ch]) * weights[3];
                    out_row[o + ch] = clamp_to_byte(v);
                }
            }
        });
    }

    /**
     * Vertical bicubic pass: every column of src resampled to dst.height().
     * dst.width() == src.width().
     */
    inline void bicubic_vertical_pass(const pixel_buffer& src, pixel_buffer& dst,
                                      std::size_t parallelism) {
        constexpr dimension_t n = weight_table::taps;
        RESAMPLER_DEBUG_ASSERT(src.width() == dst.width());

        const dimension_t row_bytes = dst.row_bytes();
        const weight_table table = build_weight_table(src.height(), dst.height());

        for_each_row_parallel(dst, parallelism, [&](byte_span out_row, index_t out_y) {
            const index_t* rows = table.indices.data() + out_y * n;
            const float* w = table.weights.data() + out_y * n;

            const const_byte_span in_row1 = src.row(rows[0]);
            const const_byte_span in_row2 = src.row(rows[1]);
            const const_byte_span in_row3 = src.row(rows[2]);
            const const_byte_span in_row4 = src.row(rows[3]);

            for (index_t i = 0; i < row_bytes; ++i) {
                const float v = static_cast<float>(in_row1[i]) * w[0]
                              + static_cast<float>(in_row2[i]) * w[1]
                              + static_cast<float>(in_row3[i]) * w[2]
                              + static_cast<float>(in_row4[i]) * w[3];
                out_row[i] = clamp_to_byte(v);
            }
        });
    }

    /**
     * Separable Catmull-Rom resampling into a preallocated target.
     *
     * Runs the horizontal pass into an intermediate buffer, then the vertical
     * pass from it into dst. The vertical pass starts only after every row of
     * the horizontal pass is written. An axis whose extent does not change is
     * not convolved. Both buffers are 3 bytes per pixel.
     */
    inline void resample_bicubic_into(const pixel_buffer& src, pixel_buffer& dst,
                                      std::size_t parallelism) {
        RESAMPLER_DEBUG_ASSERT(src.bytes_per_pixel() == 3 && dst.bytes_per_pixel() == 3);

        const bool same_width = src.width() == dst.width();
        const bool same_height = src.height() == dst.height();

        if (same_width && same_height) {
            copy_pixels(src, dst);
            return;
        }
        if (same_width) {
            bicubic_vertical_pass(src, dst, parallelism);
            return;
        }
        if (same_height) {
            bicubic_horizontal_pass(src, dst, parallelism);
            return;
        }

        pixel_buffer horizontal(dst.width(), src.height(), 3);
        bicubic_horizontal_pass(src, horizontal, parallelism);
        bicubic_vertical_pass(horizontal, dst, parallelism);
    }

    /**
     * Separable Catmull-Rom resampling to an arbitrary target size
     */
    inline pixel_buffer resample_bicubic(const pixel_buffer& src,
                                         dimension_t dst_width, dimension_t dst_height,
                                         std::size_t parallelism) {
        pixel_buffer result(dst_width, dst_height, src.bytes_per_pixel());
        resample_bicubic_into(src, result, parallelism);
        return result;
    }

} // namespace resampler
