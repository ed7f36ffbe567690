/**
 * @file format_sniffer.hpp
 * @brief Magic-byte format detection and extension spoof checks.
 */

#ifndef SCOUR_FORMAT_SNIFFER_HPP
#define SCOUR_FORMAT_SNIFFER_HPP

#include "image_format.hpp"
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>

namespace scour {

    /**
     * @brief Identifies image formats from their leading bytes.
     *
     * @details The extension of a file is never trusted. sniff() reads at most
     * kHeaderSize bytes and matches them against the JPEG, PNG, GIF, WebP, BMP
     * and TIFF signatures.
     */
    class FormatSniffer {
    public:
        static constexpr std::size_t kHeaderSize = 12;

        /**
         * @brief Detect the format of a file on disk.
         * @throws FormatUnknownError if the file cannot be read, holds fewer than
         * 2 bytes, or matches no signature.
         */
        static ImageFormat sniff(const std::filesystem::path& path);

        /**
         * @brief Detect the format of an in-memory header.
         * @param header Leading bytes of the file; only the first kHeaderSize matter.
         * @throws FormatUnknownError as sniff().
         */
        static ImageFormat sniff_bytes(std::span<const std::uint8_t> header);

        /**
         * @brief Compare the format promised by the extension with the real one.
         * @return The `SPOOF_{claimed}→{real}` action on mismatch, nothing otherwise
         * (also nothing for extensions outside the image set).
         */
        static std::optional<std::string> detect_spoof(const std::filesystem::path& path, ImageFormat real);
    };

} // namespace scour

#endif // SCOUR_FORMAT_SNIFFER_HPP
