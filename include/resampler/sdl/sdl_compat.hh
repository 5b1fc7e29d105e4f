#pragma once

#include <resampler/warning_macros.hh>

// SDL version detection and includes
RESAMPLER_DISABLE_ALL_WARNINGS_PUSH
#ifdef RESAMPLER_HAS_SDL3
    #include <SDL3/SDL.h>
#elif defined(RESAMPLER_HAS_SDL2)
    #include <SDL2/SDL.h>
#else
    #error "No SDL version defined. Please ensure SDL2 or SDL3 is found by CMake."
#endif
RESAMPLER_DISABLE_ALL_WARNINGS_POP

// SDL2/SDL3 compatibility layer: SDL3 names, implemented on top of SDL2
#ifdef RESAMPLER_HAS_SDL2
    // SDL2 surface creation compatibility
    inline SDL_Surface* SDL_CreateSurface(int width, int height, Uint32 format) {
        return SDL_CreateRGBSurfaceWithFormat(0, width, height,
                                              SDL_BITSPERPIXEL(format), format);
    }

    // SDL2 uses SDL_FreeSurface instead of SDL_DestroySurface
    inline void SDL_DestroySurface(SDL_Surface* surface) {
        SDL_FreeSurface(surface);
    }

    // SDL3 converts by format enum; SDL2 needs SDL_ConvertSurfaceFormat
    inline SDL_Surface* SDL_ConvertSurface(SDL_Surface* surface, Uint32 format) {
        return SDL_ConvertSurfaceFormat(surface, format, 0);
    }
#endif

namespace resampler::sdl {

#ifdef RESAMPLER_HAS_SDL3
    using pixel_format_t = SDL_PixelFormat;
#else
    using pixel_format_t = Uint32;
#endif

    // Pixel format enum of a surface, for either SDL version
    inline Uint32 surface_format(const SDL_Surface* surface) {
#ifdef RESAMPLER_HAS_SDL3
        return static_cast<Uint32>(surface->format);
#else
        return surface->format->format;
#endif
    }

    // SDL2 returns 0 on success, SDL3 returns true
    inline bool lock_surface(SDL_Surface* surface) {
#ifdef RESAMPLER_HAS_SDL3
        return SDL_LockSurface(surface);
#else
        return SDL_LockSurface(surface) == 0;
#endif
    }

} // namespace resampler::sdl
