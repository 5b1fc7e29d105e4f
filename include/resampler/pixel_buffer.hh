#pragma once

#include <resampler/byte_span.hh>
#include <resampler/compiler_compat.hh>
#include <resampler/exceptions.hh>
#include <resampler/types.hh>
#include <vector>
#include <cstdint>
#include <cstring>
#include <string>
#include <stdexcept>
#include <algorithm>
#include <limits>

namespace resampler {

    /**
     * One pixel as channel bytes. Storage order in the buffer is B, G, R[, A].
     * Reading a 3-byte pixel yields a = 255; writing a 3-byte pixel ignores a.
     */
    struct pixel_value {
        std::uint8_t b{0};
        std::uint8_t g{0};
        std::uint8_t r{0};
        std::uint8_t a{255};

        pixel_value() = default;

        pixel_value(std::uint8_t blue, std::uint8_t green, std::uint8_t red, std::uint8_t alpha = 255)
            : b(blue), g(green), r(red), a(alpha) {}

        // Build from conventional RGB order
        static pixel_value from_rgb(std::uint8_t red, std::uint8_t green, std::uint8_t blue) {
            return {blue, green, red};
        }
    };

    inline bool operator ==(const pixel_value& x, const pixel_value& y) noexcept {
        return x.b == y.b && x.g == y.g && x.r == y.r && x.a == y.a;
    }

    inline bool operator !=(const pixel_value& x, const pixel_value& y) noexcept {
        return !(x == y);
    }

    class pixel_buffer;

    /**
     * Mutable view over the rows [first, last) of a pixel_buffer.
     *
     * A parallel worker receives exactly one row_block; blocks handed out for
     * one pass never overlap, so workers write without synchronisation.
     */
    class row_block {
        public:
            row_block(std::uint8_t* base, index_t first, index_t last,
                      dimension_t stride, dimension_t row_bytes) noexcept
                : m_base(base), m_first(first), m_last(last),
                  m_stride(stride), m_row_bytes(row_bytes) {}

            [[nodiscard]] index_t first() const noexcept { return m_first; }
            [[nodiscard]] index_t last() const noexcept { return m_last; }

            // Writable scanline y; y must lie inside this block
            [[nodiscard]] byte_span row(index_t y) const noexcept {
                RESAMPLER_DEBUG_ASSERT(y >= m_first && y < m_last);
                return {m_base + y * m_stride, m_row_bytes};
            }

        private:
            std::uint8_t* m_base;
            index_t m_first;
            index_t m_last;
            dimension_t m_stride;
            dimension_t m_row_bytes;
    };

    /**
     * Owned packed image: width x height pixels of 3 (BGR) or 4 (BGRA) bytes,
     * rows stride bytes apart. Padding bytes between width*bpp and stride are
     * never read as pixel data.
     */
    class pixel_buffer {
        public:
            /**
             * Create a zero-filled buffer
             * @param width Width in pixels
             * @param height Height in pixels
             * @param bytes_per_pixel 3 or 4
             * @param stride Bytes per row; 0 selects width * bytes_per_pixel
             * @throws unsupported_format_exception if bytes_per_pixel is not 3 or 4
             * @throws std::invalid_argument if stride is smaller than one row of pixels,
             *         or a row or the whole buffer does not fit in size_t
             */
            pixel_buffer(dimension_t width, dimension_t height,
                         dimension_t bytes_per_pixel, dimension_t stride = 0)
                : m_width(width),
                  m_height(height),
                  m_bpp(validate_format(bytes_per_pixel)),
                  m_stride(resolve_stride(width, bytes_per_pixel, stride)),
                  m_data(checked_size_bytes(m_stride, height), 0) {
            }

            /**
             * Create a buffer holding a copy of foreign pixel memory
             * @param bytes Start of height * stride readable bytes
             */
            pixel_buffer(dimension_t width, dimension_t height,
                         dimension_t bytes_per_pixel, dimension_t stride,
                         const std::uint8_t* bytes)
                : pixel_buffer(width, height, bytes_per_pixel, stride) {
                if (bytes == nullptr && !m_data.empty()) {
                    throw std::invalid_argument("pixel_buffer: source bytes are null");
                }
                if (!m_data.empty()) {
                    std::memcpy(m_data.data(), bytes, m_data.size());
                }
            }

            /**
             * Create a tightly packed buffer with every pixel set to color
             */
            static pixel_buffer filled(dimension_t width, dimension_t height,
                                       dimension_t bytes_per_pixel, const pixel_value& color) {
                pixel_buffer result(width, height, bytes_per_pixel);
                for (index_t y = 0; y < height; ++y) {
                    for (index_t x = 0; x < width; ++x) {
                        result.set_pixel(x, y, color);
                    }
                }
                return result;
            }

            pixel_buffer(const pixel_buffer&) = default;
            pixel_buffer(pixel_buffer&&) noexcept = default;
            pixel_buffer& operator=(const pixel_buffer&) = default;
            pixel_buffer& operator=(pixel_buffer&&) noexcept = default;

            [[nodiscard]] dimension_t width() const noexcept { return m_width; }
            [[nodiscard]] dimension_t height() const noexcept { return m_height; }
            [[nodiscard]] dimension_t stride() const noexcept { return m_stride; }
            [[nodiscard]] dimension_t bytes_per_pixel() const noexcept { return m_bpp; }
            [[nodiscard]] dimension_t row_bytes() const noexcept { return m_width * m_bpp; }
            [[nodiscard]] target_size size() const noexcept { return {m_width, m_height}; }
            [[nodiscard]] bool has_alpha() const noexcept { return m_bpp == 4; }

            [[nodiscard]] std::uint8_t* data() noexcept { return m_data.data(); }
            [[nodiscard]] const std::uint8_t* data() const noexcept { return m_data.data(); }
            [[nodiscard]] std::size_t size_bytes() const noexcept { return m_data.size(); }

            // Scanline y without its padding
            [[nodiscard]] byte_span row(index_t y) noexcept {
                RESAMPLER_DEBUG_ASSERT(y < m_height);
                return {m_data.data() + y * m_stride, row_bytes()};
            }

            [[nodiscard]] const_byte_span row(index_t y) const noexcept {
                RESAMPLER_DEBUG_ASSERT(y < m_height);
                return {m_data.data() + y * m_stride, row_bytes()};
            }

            // Channel bytes of one pixel
            [[nodiscard]] byte_span pixel(index_t x, index_t y) noexcept {
                RESAMPLER_DEBUG_ASSERT(x < m_width);
                return row(y).subspan(x * m_bpp, m_bpp);
            }

            [[nodiscard]] const_byte_span pixel(index_t x, index_t y) const noexcept {
                RESAMPLER_DEBUG_ASSERT(x < m_width);
                return row(y).subspan(x * m_bpp, m_bpp);
            }

            [[nodiscard]] pixel_value get_pixel(index_t x, index_t y) const noexcept {
                const auto p = pixel(x, y);
                return {p[0], p[1], p[2], m_bpp == 4 ? p[3] : std::uint8_t{255}};
            }

            void set_pixel(index_t x, index_t y, const pixel_value& value) noexcept {
                const auto p = pixel(x, y);
                p[0] = value.b;
                p[1] = value.g;
                p[2] = value.r;
                if (m_bpp == 4) {
                    p[3] = value.a;
                }
            }

            /**
             * Writable view over rows [first, last)
             */
            [[nodiscard]] row_block rows(index_t first, index_t last) noexcept {
                RESAMPLER_DEBUG_ASSERT(first <= last && last <= m_height);
                return {m_data.data(), first, last, m_stride, row_bytes()};
            }

            [[nodiscard]] bool same_size(const pixel_buffer& other) const noexcept {
                return m_width == other.m_width && m_height == other.m_height;
            }

        private:
            static dimension_t validate_format(dimension_t bytes_per_pixel) {
                if (bytes_per_pixel != 3 && bytes_per_pixel != 4) {
                    throw unsupported_format_exception(bytes_per_pixel);
                }
                return bytes_per_pixel;
            }

            static std::size_t checked_size_bytes(dimension_t stride, dimension_t height) {
                if (height != 0 && stride > std::numeric_limits<std::size_t>::max() / height) {
                    throw std::invalid_argument("pixel_buffer: " + std::to_string(stride) + " x " +
                                                std::to_string(height) + " bytes overflows the buffer size");
                }
                return stride * height;
            }

            static dimension_t resolve_stride(dimension_t width, dimension_t bytes_per_pixel,
                                              dimension_t stride) {
                if (width > std::numeric_limits<dimension_t>::max() / bytes_per_pixel) {
                    throw std::invalid_argument("pixel_buffer: width " + std::to_string(width) +
                                                " overflows the row size");
                }
                const dimension_t packed = width * bytes_per_pixel;
                if (stride == 0) {
                    return packed;
                }
                if (stride < packed) {
                    throw std::invalid_argument("pixel_buffer: stride " + std::to_string(stride) +
                                                " is smaller than one row (" + std::to_string(packed) +
                                                " bytes)");
                }
                return stride;
            }

            dimension_t m_width;
            dimension_t m_height;
            dimension_t m_bpp;
            dimension_t m_stride;
            std::vector<std::uint8_t> m_data;
    };

    /**
     * Pixel equality: same dimensions, same format, same pixel bytes.
     * Row padding does not take part in the comparison.
     */
    inline bool operator ==(const pixel_buffer& a, const pixel_buffer& b) noexcept {
        if (!a.same_size(b) || a.bytes_per_pixel() != b.bytes_per_pixel()) {
            return false;
        }
        for (index_t y = 0; y < a.height(); ++y) {
            const auto ra = a.row(y);
            const auto rb = b.row(y);
            if (!std::equal(ra.begin(), ra.end(), rb.begin())) {
                return false;
            }
        }
        return true;
    }

    inline bool operator !=(const pixel_buffer& a, const pixel_buffer& b) noexcept {
        return !(a == b);
    }

    /**
     * Copy pixel rows between two buffers of equal size and format; strides may differ
     */
    inline void copy_pixels(const pixel_buffer& src, pixel_buffer& dst) noexcept {
        RESAMPLER_DEBUG_ASSERT(src.same_size(dst) && src.bytes_per_pixel() == dst.bytes_per_pixel());
        for (index_t y = 0; y < src.height(); ++y) {
            const auto in = src.row(y);
            std::copy(in.begin(), in.end(), dst.row(y).begin());
        }
    }

} // namespace resampler
