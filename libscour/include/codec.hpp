/**
 * @file codec.hpp
 * @brief Interface implemented by every image codec backend.
 */

#ifndef SCOUR_CODEC_HPP
#define SCOUR_CODEC_HPP

#include "decoded_image.hpp"
#include "image_format.hpp"
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace scour {

/**
 * @brief Dimensions read from a header without touching pixel data.
 * Signed so a corrupt header can report a non-positive size.
 */
struct ImageHeader {
    std::int64_t width = 0;
    std::int64_t height = 0;
};

struct EncodeOptions {
    int jpeg_quality = 95;
};

/**
 * @brief Decoder (and optionally encoder) for one or more image formats.
 *
 * Implementations are stateless and shared between worker threads; every
 * call sets up and tears down its own library context. Errors raised by the
 * underlying C library are converted to DecodeError / ReencodeError.
 */
class ICodec {
public:
    virtual ~ICodec() = default;

    // --- self-description ---

    /// @return Human-readable name of the codec (e.g. "PngCodec").
    [[nodiscard]] virtual std::string_view get_name() const noexcept = 0;

    /// @return Formats this codec decodes.
    [[nodiscard]] virtual std::span<const ImageFormat> get_supported_formats() const noexcept = 0;

    /// @return True if encode() is implemented.
    [[nodiscard]] virtual bool can_encode() const noexcept = 0;

    // --- operations ---

    /**
     * @brief Parse only the header.
     * @throws DecodeError if the header is unreadable.
     */
    [[nodiscard]] virtual ImageHeader read_header(std::span<const std::uint8_t> data) const = 0;

    /**
     * @brief Decode the full raster.
     * @throws DecodeError on any failure.
     */
    [[nodiscard]] virtual DecodedImage decode(std::span<const std::uint8_t> data) const = 0;

    /**
     * @brief Encode an image. No ancillary metadata is written.
     * @throws ReencodeError on failure or if the codec cannot encode.
     */
    [[nodiscard]] virtual std::vector<std::uint8_t> encode(const DecodedImage& image,
                                                           const EncodeOptions& options) const = 0;
};

} // namespace scour

#endif // SCOUR_CODEC_HPP
