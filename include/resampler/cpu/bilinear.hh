#pragma once

#include <resampler/compiler_compat.hh>
#include <resampler/cpu/clamp.hh>
#include <resampler/cpu/row_parallel.hh>
#include <resampler/pixel_buffer.hh>
#include <resampler/types.hh>
#include <resampler/warning_macros.hh>
#include <vector>
#include <cmath>
#include <cstddef>

namespace resampler {

    /**
     * The two source samples contributing to one output coordinate on one axis.
     * near_index is the pixel containing the mapped centre; far_index is its
     * neighbour on the side the centre leans toward (clamped at the borders,
     * so both may coincide).
     */
    struct bilinear_taps {
        index_t near_index;
        index_t far_index;
        float near_weight;
        float far_weight;
    };

    /**
     * Taps for output coordinate out on an axis mapping in_extent -> out_extent
     */
    inline bilinear_taps compute_bilinear_taps(index_t out, float ratio, index_t last) noexcept {
        const float center = (RESAMPLER_SIZE_TO_FLOAT(out) + 0.5f) * ratio;
        const index_t near_index = clamp_index(static_cast<index_t>(center), last);
        const float offset = center - (RESAMPLER_SIZE_TO_FLOAT(near_index) + 0.5f);

        index_t far_index;
        if (offset <= 0.0f) {
            far_index = near_index == 0 ? 0 : near_index - 1;
        } else {
            far_index = clamp_index(near_index + 1, last);
        }

        const float near_weight = 1.0f - std::fabs(offset);
        return {near_index, far_index, near_weight, 1.0f - near_weight};
    }

    /**
     * Taps for every output coordinate along one axis
     */
    inline std::vector<bilinear_taps> build_bilinear_taps(dimension_t in_extent, dimension_t out_extent) {
        std::vector<bilinear_taps> taps(out_extent);
        const float ratio = RESAMPLER_SIZE_TO_FLOAT(in_extent) / RESAMPLER_SIZE_TO_FLOAT(out_extent);
        const index_t last = in_extent - 1;
        for (index_t i = 0; i < out_extent; ++i) {
            taps[i] = compute_bilinear_taps(i, ratio, last);
        }
        return taps;
    }

    /**
     * Bilinear interpolation into a preallocated target - arbitrary scale factors.
     *
     * Each output pixel is the renormalised product-weighted sum of four source
     * pixels. Borders clamp; nothing wraps or extrapolates. Both buffers are 3
     * bytes per pixel.
     */
    inline void resample_bilinear_into(const pixel_buffer& src, pixel_buffer& dst,
                                       std::size_t parallelism) {
        constexpr dimension_t bpp = 3;
        RESAMPLER_DEBUG_ASSERT(src.bytes_per_pixel() == bpp && dst.bytes_per_pixel() == bpp);

        const dimension_t dst_width = dst.width();

        // Column taps are shared read-only by every row task
        const std::vector<bilinear_taps> col_taps = build_bilinear_taps(src.width(), dst_width);
        const float y_ratio = RESAMPLER_SIZE_TO_FLOAT(src.height()) / RESAMPLER_SIZE_TO_FLOAT(dst.height());
        const index_t last_y = src.height() - 1;

        for_each_row_parallel(dst, parallelism, [&](byte_span out_row, index_t out_y) {
            const bilinear_taps row_taps = compute_bilinear_taps(out_y, y_ratio, last_y);
            const const_byte_span in_row1 = src.row(row_taps.near_index);
            const const_byte_span in_row2 = src.row(row_taps.far_index);

            index_t o = 0;
            for (index_t x = 0; x < dst_width; ++x, o += bpp) {
                const bilinear_taps& ct = col_taps[x];
                const index_t c1 = ct.near_index * bpp;
                const index_t c2 = ct.far_index * bpp;

                float w1 = ct.near_weight * row_taps.near_weight;
                float w2 = ct.far_weight * row_taps.near_weight;
                float w3 = ct.near_weight * row_taps.far_weight;
                float w4 = ct.far_weight * row_taps.far_weight;

                const float normaliser = 1.0f / (w1 + w2 + w3 + w4);
                w1 *= normaliser;
                w2 *= normaliser;
                w3 *= normaliser;
                w4 *= normaliser;

                for (index_t ch = 0; ch < bpp; ++ch) {
                    const float v = static_cast<float>(in_row1[c1 + ch]) * w1
                                  + static_cast<float>(in_row1[c2 + ch]) * w2
                                  + static_cast<float>(in_row2[c1 + ch]) * w3
                                  + static_cast<float>(in_row2[c2 + ch]) * w4;
                    out_row[o + ch] = clamp_to_byte(v);
                }
            }
        });
    }

    /**
     * Bilinear interpolation to an arbitrary target size
     * Smooth but can be blurry, good for photos and continuous-tone images
     */
    inline pixel_buffer resample_bilinear(const pixel_buffer& src,
                                          dimension_t dst_width, dimension_t dst_height,
                                          std::size_t parallelism) {
        pixel_buffer result(dst_width, dst_height, src.bytes_per_pixel());
        resample_bilinear_into(src, result, parallelism);
        return result;
    }

} // namespace resampler
