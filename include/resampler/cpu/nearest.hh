#pragma once

#include <resampler/compiler_compat.hh>
#include <resampler/cpu/row_parallel.hh>
#include <resampler/pixel_buffer.hh>
#include <resampler/types.hh>
#include <resampler/warning_macros.hh>
#include <vector>
#include <cstddef>

namespace resampler {

    /**
     * Source index sampled by output coordinate out under the half-pixel-centre
     * convention: floor((out + 0.5) * in / out_extent).
     */
    inline index_t nearest_source_index(index_t out, float ratio, index_t last) noexcept {
        const float center = (RESAMPLER_SIZE_TO_FLOAT(out) + 0.5f) * ratio;
        // center < in_extent mathematically; float rounding can land on it for huge ratios
        return clamp_index(static_cast<index_t>(center), last);
    }

    /**
     * Nearest neighbor resampling into a preallocated target.
     * Channel bytes are copied verbatim. Both buffers are 3 bytes per pixel.
     */
    inline void resample_nearest_into(const pixel_buffer& src, pixel_buffer& dst,
                                      std::size_t parallelism) {
        constexpr dimension_t bpp = 3;
        RESAMPLER_DEBUG_ASSERT(src.bytes_per_pixel() == bpp && dst.bytes_per_pixel() == bpp);

        const dimension_t dst_width = dst.width();
        const float x_ratio = RESAMPLER_SIZE_TO_FLOAT(src.width()) / RESAMPLER_SIZE_TO_FLOAT(dst_width);
        const float y_ratio = RESAMPLER_SIZE_TO_FLOAT(src.height()) / RESAMPLER_SIZE_TO_FLOAT(dst.height());
        const index_t last_x = src.width() - 1;
        const index_t last_y = src.height() - 1;

        // Byte offset of the sampled source pixel for every output column
        std::vector<index_t> src_cols(dst_width);
        for (index_t x = 0; x < dst_width; ++x) {
            src_cols[x] = nearest_source_index(x, x_ratio, last_x) * bpp;
        }

        for_each_row_parallel(dst, parallelism, [&](byte_span out_row, index_t out_y) {
            const const_byte_span in_row = src.row(nearest_source_index(out_y, y_ratio, last_y));
            index_t o = 0;
            for (index_t x = 0; x < dst_width; ++x, o += bpp) {
                const index_t c = src_cols[x];
                out_row[o] = in_row[c];
                out_row[o + 1] = in_row[c + 1];
                out_row[o + 2] = in_row[c + 2];
            }
        });
    }

    /**
     * Nearest neighbor resampling to an arbitrary target size
     */
    inline pixel_buffer resample_nearest(const pixel_buffer& src,
                                         dimension_t dst_width, dimension_t dst_height,
                                         std::size_t parallelism) {
        pixel_buffer result(dst_width, dst_height, src.bytes_per_pixel());
        resample_nearest_into(src, result, parallelism);
        return result;
    }

} // namespace resampler
