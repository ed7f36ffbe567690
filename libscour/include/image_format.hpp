/**
 * @file image_format.hpp
 * @brief Defines the raster formats scour recognizes and the extension tables.
 *
 * The format of a file is always decided from its leading bytes (see
 * FormatSniffer); the extension table only tells which format a file
 * claims to be, for spoof detection and discovery.
 */

#ifndef SCOUR_IMAGE_FORMAT_HPP
#define SCOUR_IMAGE_FORMAT_HPP

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace scour {

/**
 * @brief Raster formats that can be sniffed and decoded.
 */
enum class ImageFormat {
    Jpeg,
    Png,
    Gif,
    Webp,
    Bmp,
    Tiff,
    Unknown
};

///< Map linking lowercase extensions (with dot) to the format they promise.
inline const std::unordered_map<std::string, ImageFormat> extension_to_format = {
    { ".jpg",  ImageFormat::Jpeg },
    { ".jpeg", ImageFormat::Jpeg },
    { ".png",  ImageFormat::Png },
    { ".gif",  ImageFormat::Gif },
    { ".bmp",  ImageFormat::Bmp },
    { ".tif",  ImageFormat::Tiff },
    { ".tiff", ImageFormat::Tiff },
    { ".webp", ImageFormat::Webp },
};

/**
 * @brief Converts an ImageFormat to its lowercase name.
 * @return A string such as "jpeg", "png" or "unknown".
 */
inline std::string image_format_to_string(const ImageFormat fmt) {
    switch (fmt) {
        case ImageFormat::Jpeg: return "jpeg";
        case ImageFormat::Png:  return "png";
        case ImageFormat::Gif:  return "gif";
        case ImageFormat::Webp: return "webp";
        case ImageFormat::Bmp:  return "bmp";
        case ImageFormat::Tiff: return "tiff";
        default:                return "unknown";
    }
}

/**
 * @brief Lowercased extension of a path, including the leading dot.
 */
inline std::string lower_extension(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    std::ranges::transform(ext, ext.begin(),
        [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return ext;
}

/**
 * @brief Format a file name promises through its extension (case-insensitive).
 * @return std::nullopt for extensions outside the image set.
 */
inline std::optional<ImageFormat> format_from_extension(const std::filesystem::path& path) {
    const auto it = extension_to_format.find(lower_extension(path));
    if (it == extension_to_format.end()) return std::nullopt;
    return it->second;
}

/**
 * @brief True if the file name carries one of the image extensions.
 */
inline bool has_image_extension(const std::filesystem::path& path) {
    return format_from_extension(path).has_value();
}

} // namespace scour

#endif // SCOUR_IMAGE_FORMAT_HPP
