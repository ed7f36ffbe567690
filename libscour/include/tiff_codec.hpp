/**
 * @file tiff_codec.hpp
 * @brief Decode-only TIFF backend on libtiff.
 */

#ifndef SCOUR_TIFF_CODEC_HPP
#define SCOUR_TIFF_CODEC_HPP

#include "codec.hpp"
#include <array>
#include <span>
#include <string_view>

namespace scour {

    /**
     * @brief Reads any TIFF libtiff understands through TIFFReadRGBAImageOriented.
     * Always yields RGBA.
     */
    class TiffCodec final : public ICodec {
    public:
        [[nodiscard]] std::string_view get_name() const noexcept override {
            return "TiffCodec";
        }

        [[nodiscard]] std::span<const ImageFormat> get_supported_formats() const noexcept override {
            static constexpr std::array<ImageFormat, 1> kFormats = { ImageFormat::Tiff };
            return {kFormats.data(), kFormats.size()};
        }

        [[nodiscard]] bool can_encode() const noexcept override { return false; }

        [[nodiscard]] ImageHeader read_header(std::span<const std::uint8_t> data) const override;

        [[nodiscard]] DecodedImage decode(std::span<const std::uint8_t> data) const override;

        [[nodiscard]] std::vector<std::uint8_t> encode(const DecodedImage& image,
                                                       const EncodeOptions& options) const override;
    };

} // namespace scour

#endif // SCOUR_TIFF_CODEC_HPP
