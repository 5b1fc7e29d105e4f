#pragma once

#include <resampler/sdl/sdl_compat.hh>
#include <resampler/pixel_buffer.hh>
#include <resampler/types.hh>
#include <memory>
#include <stdexcept>
#include <string>
#include <algorithm>

namespace resampler {

    struct sdl_surface_deleter {
        void operator()(SDL_Surface* surface) const noexcept {
            if (surface) {
                SDL_DestroySurface(surface);
            }
        }
    };

    // Owning SDL surface handle
    using sdl_surface_ptr = std::unique_ptr<SDL_Surface, sdl_surface_deleter>;

    namespace sdl {
        // Locks a surface for direct pixel access while in scope
        class surface_lock {
            public:
                explicit surface_lock(SDL_Surface* surface)
                    : m_surface(SDL_MUSTLOCK(surface) ? surface : nullptr) {
                    if (m_surface && !lock_surface(m_surface)) {
                        throw std::runtime_error(std::string("SDL_LockSurface failed: ") + SDL_GetError());
                    }
                }

                ~surface_lock() {
                    if (m_surface) {
                        SDL_UnlockSurface(m_surface);
                    }
                }

                surface_lock(const surface_lock&) = delete;
                surface_lock& operator=(const surface_lock&) = delete;

            private:
                SDL_Surface* m_surface;
        };
    } // namespace sdl

    /**
     * Copy an SDL surface into a 3-byte BGR pixel_buffer.
     *
     * Surfaces already in SDL_PIXELFORMAT_BGR24 are copied row by row with
     * their pitch; any other format is first converted by SDL (alpha dropped).
     *
     * @throws std::invalid_argument if surface is null
     * @throws std::runtime_error if SDL cannot convert or lock the surface
     */
    inline pixel_buffer sdl_to_pixel_buffer(SDL_Surface* surface) {
        if (!surface) {
            throw std::invalid_argument("sdl_to_pixel_buffer: surface is null");
        }

        sdl_surface_ptr converted;
        SDL_Surface* bgr = surface;
        if (sdl::surface_format(surface) != SDL_PIXELFORMAT_BGR24) {
            converted.reset(SDL_ConvertSurface(surface, SDL_PIXELFORMAT_BGR24));
            if (!converted) {
                throw std::runtime_error(std::string("SDL_ConvertSurface failed: ") + SDL_GetError());
            }
            bgr = converted.get();
        }

        const auto width = static_cast<dimension_t>(bgr->w);
        const auto height = static_cast<dimension_t>(bgr->h);
        pixel_buffer result(width, height, 3);

        sdl::surface_lock lock(bgr);
        const auto* pixels = static_cast<const std::uint8_t*>(bgr->pixels);
        const auto pitch = static_cast<dimension_t>(bgr->pitch);
        for (index_t y = 0; y < height; ++y) {
            const std::uint8_t* src_row = pixels + y * pitch;
            auto dst_row = result.row(y);
            std::copy(src_row, src_row + dst_row.size(), dst_row.begin());
        }
        return result;
    }

    /**
     * Copy a pixel_buffer into a new SDL surface.
     * 3-byte buffers become SDL_PIXELFORMAT_BGR24, 4-byte buffers SDL_PIXELFORMAT_BGRA32.
     *
     * @throws std::runtime_error if SDL cannot create or lock the surface
     */
    inline sdl_surface_ptr pixel_buffer_to_sdl(const pixel_buffer& buffer) {
        const sdl::pixel_format_t format = buffer.has_alpha()
            ? SDL_PIXELFORMAT_BGRA32
            : SDL_PIXELFORMAT_BGR24;

        sdl_surface_ptr surface(SDL_CreateSurface(static_cast<int>(buffer.width()),
                                                  static_cast<int>(buffer.height()),
                                                  format));
        if (!surface) {
            throw std::runtime_error(std::string("SDL_CreateSurface failed: ") + SDL_GetError());
        }

        sdl::surface_lock lock(surface.get());
        auto* pixels = static_cast<std::uint8_t*>(surface->pixels);
        const auto pitch = static_cast<dimension_t>(surface->pitch);
        for (index_t y = 0; y < buffer.height(); ++y) {
            const auto src_row = buffer.row(y);
            std::copy(src_row.begin(), src_row.end(), pixels + y * pitch);
        }
        return surface;
    }

} // namespace resampler
