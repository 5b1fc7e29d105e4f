#pragma once

#include <cstddef>
#include <cstdint>
#include <type_traits>

namespace resampler {

    /**
     * Semantic type aliases for image dimensions and coordinates
     *
     * These types clarify intent and reduce casting errors:
     * - dimension_t: For width, height, stride (always non-negative)
     * - coord_t: For signed caller-facing sizes and intermediate math
     * - index_t: For validated array indices (always valid)
     */

    // Dimensions (width, height, stride) - always non-negative
    using dimension_t = std::size_t;

    // Coordinates - signed, may be negative before validation
    using coord_t = std::ptrdiff_t;

    // Array indices - always valid, non-negative
    using index_t = std::size_t;

    static_assert(std::is_unsigned_v<dimension_t>,
                  "Dimensions must be unsigned");
    static_assert(std::is_signed_v<coord_t>,
                  "Coordinates must be signed for validation of caller input");
    static_assert(std::is_unsigned_v<index_t>,
                  "Indices must be unsigned");

    // Width/height pair used for targets and fitting computations
    struct target_size {
        dimension_t width;
        dimension_t height;
    };

    inline bool operator ==(const target_size& a, const target_size& b) noexcept {
        return a.width == b.width && a.height == b.height;
    }

    inline bool operator !=(const target_size& a, const target_size& b) noexcept {
        return !(a == b);
    }

    /**
     * Helper functions for safe type conversions
     */

    // Clamp an index to [0, last]
    inline index_t clamp_index(index_t idx, index_t last) noexcept {
        return idx > last ? last : idx;
    }

    // Convert dimension to coordinate (for calculations)
    inline coord_t dim_to_coord(dimension_t dim) noexcept {
        return static_cast<coord_t>(dim);
    }

} // namespace resampler
