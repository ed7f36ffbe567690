/**
 * @file exif_orientation.hpp
 * @brief Reads the EXIF orientation tag straight from the encoded file.
 */

#ifndef SCOUR_EXIF_ORIENTATION_HPP
#define SCOUR_EXIF_ORIENTATION_HPP

#include "image_format.hpp"
#include <cstdint>
#include <optional>
#include <span>

namespace scour {

    /**
     * @brief Orientation (1-8) stored in the file's EXIF block.
     *
     * Looks in the JPEG APP1 "Exif" segment, TIFF IFD0, the PNG eXIf chunk or
     * the WebP EXIF chunk. GIF and BMP carry no EXIF.
     *
     * @return The tag value, or nothing if there is no EXIF block, no
     * orientation entry, or the structure is truncated or out of range.
     */
    std::optional<int> read_exif_orientation(std::span<const std::uint8_t> file, ImageFormat format);

    /**
     * @brief Orientation entry of a bare TIFF structure ("II*\0" / "MM\0*" header, IFD0).
     */
    std::optional<int> read_tiff_orientation(std::span<const std::uint8_t> tiff);

} // namespace scour

#endif // SCOUR_EXIF_ORIENTATION_HPP
