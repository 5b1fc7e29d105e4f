#pragma once

#include <resampler/interpolation.hh>
#include <vector>
#include <map>
#include <string>
#include <optional>
#include <algorithm>
#include <cctype>
#include <cstddef>

namespace resampler {

    /**
     * Static information about each interpolation mode
     */
    class mode_capabilities {
    public:
        struct mode_info {
            std::string name;
            std::string description;

            // Pixel formats (bytes per pixel) accepted by scale()
            std::vector<std::size_t> supported_bytes_per_pixel;

            // Number of source taps per axis contributing to one output sample
            std::size_t taps_per_axis;

            // True if the mode runs as two separate 1-D passes
            bool separable;
        };

        /**
         * Get complete mode information
         */
        static const mode_info& get_info(interpolation_mode mode) {
            static const auto& db = get_mode_database();
            auto it = db.find(mode);
            if (it != db.end()) {
                return it->second;
            }

            static const mode_info unknown = {
                "Unknown", "Unknown interpolation mode", {}, 0, false
            };
            return unknown;
        }

        /**
         * Get mode name
         */
        static std::string get_mode_name(interpolation_mode mode) {
            return get_info(mode).name;
        }

        static std::string get_mode_description(interpolation_mode mode) {
            return get_info(mode).description;
        }

        /**
         * Check if scale() accepts a source buffer of this format for the mode
         */
        static bool is_format_supported(interpolation_mode mode, std::size_t bytes_per_pixel) {
            const auto& supported = get_info(mode).supported_bytes_per_pixel;
            return std::find(supported.begin(), supported.end(), bytes_per_pixel) != supported.end();
        }

        /**
         * Bytes per pixel required by a mode (first supported format)
         */
        static std::size_t required_bytes_per_pixel(interpolation_mode mode) {
            const auto& supported = get_info(mode).supported_bytes_per_pixel;
            return supported.empty() ? 0 : supported.front();
        }

        /**
         * Get list of all modes
         */
        static std::vector<interpolation_mode> get_all_modes() {
            return {
                interpolation_mode::NearestNeighbor,
                interpolation_mode::Bilinear,
                interpolation_mode::Bicubic
            };
        }

        /**
         * Look up a mode by name, case-insensitively. Accepts the canonical
         * names plus the short forms "nearest", "nn" and "catmull-rom".
         */
        static std::optional<interpolation_mode> parse_mode_name(const std::string& name) {
            std::string lower = name;
            std::transform(lower.begin(), lower.end(), lower.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

            static const std::map<std::string, interpolation_mode> aliases = {
                {"nearest", interpolation_mode::NearestNeighbor},
                {"nn", interpolation_mode::NearestNeighbor},
                {"catmull-rom", interpolation_mode::Bicubic},
                {"catmullrom", interpolation_mode::Bicubic}
            };
            auto alias = aliases.find(lower);
            if (alias != aliases.end()) {
                return alias->second;
            }

            for (interpolation_mode mode : get_all_modes()) {
                std::string canonical = get_mode_name(mode);
                std::transform(canonical.begin(), canonical.end(), canonical.begin(),
                               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
                if (canonical == lower) {
                    return mode;
                }
            }
            return std::nullopt;
        }

    private:
        static const std::map<interpolation_mode, mode_info>& get_mode_database() {
            static const std::map<interpolation_mode, mode_info> db = {
                {interpolation_mode::NearestNeighbor, {
                    "NearestNeighbor", "Nearest neighbor - exact copy, blocky when enlarging",
                    {3}, 1, false
                }},

                {interpolation_mode::Bilinear, {
                    "Bilinear", "Bilinear interpolation - smooth, slightly blurry",
                    {3}, 2, false
                }},

                {interpolation_mode::Bicubic, {
                    "Bicubic", "Catmull-Rom bicubic - sharper than bilinear, two separable passes",
                    {3}, 4, true
                }}
            };
            return db;
        }
    };

} // namespace resampler
