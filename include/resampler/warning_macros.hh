#pragma once

#include <cstddef>  // For size_t

/**
 * Portable warning helpers for GCC, Clang, and MSVC
 *
 * Usage:
 *   RESAMPLER_DISABLE_ALL_WARNINGS_PUSH
 *   #include <third_party_header.h>
 *   RESAMPLER_DISABLE_ALL_WARNINGS_POP
 */

#include <resampler/compiler_compat.hh>

// Convert size_t to float (for coordinate mapping)
#define RESAMPLER_SIZE_TO_FLOAT(size) \
    (static_cast<float>(size))

/**
 * Disable all warnings for third-party headers
 * Use this to wrap includes of external libraries we don't control
 */
#if defined(RESAMPLER_COMPILER_MSVC)
    #define RESAMPLER_DISABLE_ALL_WARNINGS_PUSH \
        __pragma(warning(push, 0))
    #define RESAMPLER_DISABLE_ALL_WARNINGS_POP \
        __pragma(warning(pop))
#elif defined(RESAMPLER_COMPILER_CLANG)
    #define RESAMPLER_DISABLE_ALL_WARNINGS_PUSH \
        _Pragma("clang diagnostic push") \
        _Pragma("clang diagnostic ignored \"-Weverything\"")
    #define RESAMPLER_DISABLE_ALL_WARNINGS_POP \
        _Pragma("clang diagnostic pop")
#elif defined(RESAMPLER_COMPILER_GCC)
    #define RESAMPLER_DISABLE_ALL_WARNINGS_PUSH \
        _Pragma("GCC diagnostic push") \
        _Pragma("GCC diagnostic ignored \"-Wall\"") \
        _Pragma("GCC diagnostic ignored \"-Wextra\"") \
        _Pragma("GCC diagnostic ignored \"-Wpedantic\"") \
        _Pragma("GCC diagnostic ignored \"-Wconversion\"") \
        _Pragma("GCC diagnostic ignored \"-Wsign-conversion\"") \
        _Pragma("GCC diagnostic ignored \"-Wold-style-cast\"") \
        _Pragma("GCC diagnostic ignored \"-Wcast-qual\"") \
        _Pragma("GCC diagnostic ignored \"-Wuseless-cast\"") \
        _Pragma("GCC diagnostic ignored \"-Wzero-as-null-pointer-constant\"")
    #define RESAMPLER_DISABLE_ALL_WARNINGS_POP \
        _Pragma("GCC diagnostic pop")
#else
    #define RESAMPLER_DISABLE_ALL_WARNINGS_PUSH
    #define RESAMPLER_DISABLE_ALL_WARNINGS_POP
#endif
