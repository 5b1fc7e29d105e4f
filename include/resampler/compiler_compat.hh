#pragma once

// Portable compiler compatibility macros for MSVC, GCC, Clang, and Emscripten

// Compiler detection
#if defined(_MSC_VER)
    #define RESAMPLER_COMPILER_MSVC
#elif defined(__EMSCRIPTEN__)
    #define RESAMPLER_COMPILER_EMSCRIPTEN
    #define RESAMPLER_COMPILER_CLANG  // Emscripten is based on Clang
#elif defined(__clang__)
    #define RESAMPLER_COMPILER_CLANG
#elif defined(__GNUC__)
    #define RESAMPLER_COMPILER_GCC
#endif

// Force inline macro
#if defined(RESAMPLER_COMPILER_MSVC)
    #define RESAMPLER_FORCE_INLINE __forceinline
#elif defined(RESAMPLER_COMPILER_GCC) || defined(RESAMPLER_COMPILER_CLANG)
    #define RESAMPLER_FORCE_INLINE __attribute__((always_inline)) inline
#else
    #define RESAMPLER_FORCE_INLINE inline
#endif

// Likely/unlikely branch prediction hints
#if defined(RESAMPLER_COMPILER_GCC) || defined(RESAMPLER_COMPILER_CLANG)
    #define RESAMPLER_LIKELY(x) __builtin_expect(!!(x), 1)
    #define RESAMPLER_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
    #define RESAMPLER_LIKELY(x) (x)
    #define RESAMPLER_UNLIKELY(x) (x)
#endif

// Debug-only bounds checks for span and buffer accessors
#if defined(DEBUG) || !defined(NDEBUG)
    #include <cassert>
    #define RESAMPLER_DEBUG_ASSERT(cond) assert(cond)
#else
    #define RESAMPLER_DEBUG_ASSERT(cond) ((void)0)
#endif
