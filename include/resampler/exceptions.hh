#pragma once

#include <resampler/interpolation.hh>
#include <resampler/mode_capabilities.hh>
#include <resampler/types.hh>
#include <stdexcept>
#include <string>
#include <sstream>

namespace resampler {

    /**
     * @class invalid_format_exception
     * @brief Thrown when a source buffer's pixel format is not accepted by the requested mode
     *
     * Raised by unified_resampler::scale before anything is allocated.
     *
     * @example
     * @code
     * try {
     *     auto out = unified_resampler::scale(rgba, 64, 64, interpolation_mode::Bicubic);
     * } catch (const invalid_format_exception& e) {
     *     std::cerr << e.m_bytes_per_pixel << " bpp given, "
     *               << e.m_required_bytes_per_pixel << " required\n";
     * }
     * @endcode
     */
    class invalid_format_exception : public std::runtime_error {
        public:
            /**
             * @param mode The interpolation mode that was requested
             * @param bytes_per_pixel Format of the buffer that was passed
             * @param required_bytes_per_pixel Format the mode accepts
             */
            invalid_format_exception(interpolation_mode mode,
                                     std::size_t bytes_per_pixel,
                                     std::size_t required_bytes_per_pixel)
                : std::runtime_error(make_message(mode, bytes_per_pixel, required_bytes_per_pixel))
                  , m_mode(mode)
                  , m_bytes_per_pixel(bytes_per_pixel)
                  , m_required_bytes_per_pixel(required_bytes_per_pixel) {
            }

            interpolation_mode m_mode;                 ///< Mode that was requested
            std::size_t m_bytes_per_pixel;             ///< Format that was given
            std::size_t m_required_bytes_per_pixel;    ///< Format the mode requires

        private:
            static std::string make_message(interpolation_mode mode,
                                            std::size_t bytes_per_pixel,
                                            std::size_t required_bytes_per_pixel) {
                std::stringstream ss;
                ss << mode_capabilities::get_mode_name(mode)
                   << " interpolation requires " << required_bytes_per_pixel
                   << " bytes per pixel, source buffer has " << bytes_per_pixel;
                return ss.str();
            }
    };

    /**
     * @class invalid_target_size_exception
     * @brief Thrown when a requested target width or height is not positive
     */
    class invalid_target_size_exception : public std::invalid_argument {
        public:
            invalid_target_size_exception(coord_t width, coord_t height)
                : std::invalid_argument(make_message(width, height))
                  , m_width(width)
                  , m_height(height) {
            }

            coord_t m_width;   ///< Requested width
            coord_t m_height;  ///< Requested height

        private:
            static std::string make_message(coord_t width, coord_t height) {
                std::stringstream ss;
                ss << "Target size " << width << "x" << height
                   << " is non-positive. Both width and height must be positive.";
                return ss.str();
            }
    };

    /**
     * @class unsupported_format_exception
     * @brief Thrown when a pixel_buffer is created with a format other than 3 or 4 bytes per pixel
     */
    class unsupported_format_exception : public std::runtime_error {
        public:
            explicit unsupported_format_exception(std::size_t bytes_per_pixel)
                : std::runtime_error(make_message(bytes_per_pixel))
                  , m_bytes_per_pixel(bytes_per_pixel) {
            }

            std::size_t m_bytes_per_pixel; ///< Format that was requested

        private:
            static std::string make_message(std::size_t bytes_per_pixel) {
                std::stringstream ss;
                ss << "Unsupported pixel format: " << bytes_per_pixel
                   << " bytes per pixel. Supported formats: 3 (BGR), 4 (BGRA).";
                return ss.str();
            }
    };

} // namespace resampler
