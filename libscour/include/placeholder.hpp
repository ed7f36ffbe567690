/**
 * @file placeholder.hpp
 * @brief Stand-in SVG written in place of images that cannot be kept.
 */

#ifndef SCOUR_PLACEHOLDER_HPP
#define SCOUR_PLACEHOLDER_HPP

#include <cstdint>
#include <filesystem>
#include <string_view>

namespace scour {

    /// 400x300, light gray with a dashed border, caption in Chinese and English.
    inline constexpr std::string_view kPlaceholderSvg =
        R"(<?xml version="1.0" encoding="UTF-8"?>
<svg xmlns="http://www.w3.org/2000/svg" width="400" height="300">
  <rect width="400" height="300" fill="#f8f8f8"/>
  <rect x="10" y="10" width="380" height="280" fill="none" stroke="#ddd" stroke-width="2" stroke-dasharray="8,4"/>
  <text x="200" y="140" text-anchor="middle" font-family="sans-serif" font-size="16" fill="#999">⚠️ 损坏图像已移除</text>
  <text x="200" y="165" text-anchor="middle" font-family="sans-serif" font-size="11" fill="#bbb">Corrupted Image Removed</text>
</svg>)";

    /**
     * @brief Swaps an unrecoverable image for the placeholder SVG.
     */
    class PlaceholderSubstitutor {
    public:
        /// Path the placeholder for `original` is written to (same stem, ".svg").
        static std::filesystem::path placeholder_path(const std::filesystem::path& original);

        /**
         * @brief Write the SVG next to the original, then delete the original.
         * @return Path of the written SVG.
         * @throws ReencodeError if the SVG cannot be written or the original
         * cannot be removed.
         */
        static std::filesystem::path substitute(const std::filesystem::path& original);
    };

} // namespace scour

#endif // SCOUR_PLACEHOLDER_HPP
