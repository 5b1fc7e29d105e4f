#pragma once

#include <resampler/compiler_compat.hh>
#include <resampler/types.hh>
#include <cstdint>
#include <type_traits>

namespace resampler {
    /**
     * Non-owning view over a contiguous run of bytes (one scanline or one pixel).
     *
     * The length is fixed at construction, and every indexed access is checked
     * against it in debug builds. Hot loops take a span once per row and then
     * index it without further per-pixel bookkeeping.
     *
     * @tparam Byte std::uint8_t for a mutable view, const std::uint8_t for read-only
     */
    template<typename Byte>
    class basic_byte_span {
        static_assert(std::is_same_v<std::remove_const_t<Byte>, std::uint8_t>,
                      "byte spans only view std::uint8_t storage");
        public:
            using value_type = std::remove_const_t<Byte>;
            using pointer = Byte*;
            using reference = Byte&;
            using iterator = Byte*;

            constexpr basic_byte_span() noexcept = default;

            constexpr basic_byte_span(Byte* data, std::size_t size) noexcept
                : m_data(data), m_size(size) {}

            // mutable -> const conversion
            template<typename Other,
                     typename = std::enable_if_t<std::is_const_v<Byte> && !std::is_const_v<Other>>>
            constexpr basic_byte_span(const basic_byte_span<Other>& other) noexcept
                : m_data(other.data()), m_size(other.size()) {}

            [[nodiscard]] constexpr Byte* data() const noexcept { return m_data; }
            [[nodiscard]] constexpr std::size_t size() const noexcept { return m_size; }
            [[nodiscard]] constexpr bool empty() const noexcept { return m_size == 0; }

            [[nodiscard]] constexpr iterator begin() const noexcept { return m_data; }
            [[nodiscard]] constexpr iterator end() const noexcept { return m_data + m_size; }

            RESAMPLER_FORCE_INLINE reference operator [](index_t i) const noexcept {
                RESAMPLER_DEBUG_ASSERT(i < m_size);
                return m_data[i];
            }

            /**
             * View of count bytes starting at offset; the sub-range must lie
             * inside this span.
             */
            [[nodiscard]] basic_byte_span subspan(index_t offset, std::size_t count) const noexcept {
                RESAMPLER_DEBUG_ASSERT(offset <= m_size && count <= m_size - offset);
                return {m_data + offset, count};
            }

        private:
            Byte* m_data = nullptr;
            std::size_t m_size = 0;
    };

    using byte_span = basic_byte_span<std::uint8_t>;
    using const_byte_span = basic_byte_span<const std::uint8_t>;

} // namespace resampler
