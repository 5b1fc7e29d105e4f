#pragma once

namespace resampler {

    // Interpolation policies understood by unified_resampler
    enum class interpolation_mode {
        NearestNeighbor,  // Direct address mapping, exact byte copy
        Bilinear,         // 2x2 taps, one pass
        Bicubic,          // Separable 4-tap Catmull-Rom, two passes

        // Aliases
        Nearest = NearestNeighbor,
        CatmullRom = Bicubic,
    };

} // namespace resampler
