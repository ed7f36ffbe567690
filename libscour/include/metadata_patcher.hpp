/**
 * @file metadata_patcher.hpp
 * @brief Segment/chunk-exact resolution patches on encoded JPEG and PNG streams.
 *
 * Both patchers walk the container structure instead of searching for byte
 * patterns: a PNG IDAT payload or a JPEG thumbnail may contain "pHYs" or
 * "JFIF" by chance.
 */

#ifndef SCOUR_METADATA_PATCHER_HPP
#define SCOUR_METADATA_PATCHER_HPP

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace scour::metadata {

    /// Size of the APP0 segment inserted when a JPEG has none.
    inline constexpr std::size_t kJfifSegmentSize = 18;
    /// Size of the pHYs chunk inserted when a PNG has none.
    inline constexpr std::size_t kPhysChunkSize = 21;

    /**
     * @brief Set the JFIF density to dpi dots per inch.
     *
     * Overwrites units and densities in an existing JFIF APP0 (same length),
     * otherwise inserts an 18-byte APP0 right after SOI. Data that does not
     * start with SOI is returned unchanged.
     */
    std::vector<std::uint8_t> inject_jfif_dpi(std::vector<std::uint8_t> jpeg, std::uint16_t dpi);

    /**
     * @brief Set the PNG physical pixel size to dpi, in pixels per metre.
     *
     * Rewrites an existing 9-byte pHYs and its CRC, otherwise inserts a
     * 21-byte pHYs right after IHDR. Applying it twice gives identical bytes.
     * Data without a PNG signature and IHDR is returned unchanged.
     */
    std::vector<std::uint8_t> inject_png_phys(std::vector<std::uint8_t> png, std::uint32_t dpi);

    /// round(dpi / 0.0254); 96 dpi gives 3780.
    std::uint32_t dpi_to_ppm(std::uint32_t dpi);

    /// CRC-32 (ISO-HDLC) as used by PNG chunks.
    std::uint32_t crc32(std::span<const std::uint8_t> data);

} // namespace scour::metadata

#endif // SCOUR_METADATA_PATCHER_HPP
