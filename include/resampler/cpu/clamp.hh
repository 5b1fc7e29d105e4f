#pragma once

#include <resampler/compiler_compat.hh>
#include <cstdint>

namespace resampler {

    /**
     * Saturate a weighted channel value to a byte
     *
     * @return 0 below zero, 255 above 255, otherwise the value rounded half-up
     */
    RESAMPLER_FORCE_INLINE std::uint8_t clamp_to_byte(float value) noexcept {
        if (value < 0.0f) {
            return 0;
        }
        if (value > 255.0f) {
            return 255;
        }
        return static_cast<std::uint8_t>(value + 0.5f);
    }

} // namespace resampler
