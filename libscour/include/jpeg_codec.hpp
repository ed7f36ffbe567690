/**
 * @file jpeg_codec.hpp
 * @brief JPEG backend on libjpeg.
 */

#ifndef SCOUR_JPEG_CODEC_HPP
#define SCOUR_JPEG_CODEC_HPP

#include "codec.hpp"
#include <array>
#include <span>
#include <string_view>

namespace scour {

    /**
     * @brief Implements ICodec for JPEG files using libjpeg.
     *
     * @details Grayscale sources decode to Gray, everything else to RGB
     * (Adobe CMYK/YCCK is converted by hand since libjpeg only passes it
     * through). Encoding writes a baseline JFIF stream with optimized
     * Huffman tables and no other markers.
     */
    class JpegCodec final : public ICodec {
    public:
        [[nodiscard]] std::string_view get_name() const noexcept override {
            return "JpegCodec";
        }

        [[nodiscard]] std::span<const ImageFormat> get_supported_formats() const noexcept override {
            static constexpr std::array<ImageFormat, 1> kFormats = { ImageFormat::Jpeg };
            return {kFormats.data(), kFormats.size()};
        }

        [[nodiscard]] bool can_encode() const noexcept override { return true; }

        [[nodiscard]] ImageHeader read_header(std::span<const std::uint8_t> data) const override;

        [[nodiscard]] DecodedImage decode(std::span<const std::uint8_t> data) const override;

        [[nodiscard]] std::vector<std::uint8_t> encode(const DecodedImage& image,
                                                       const EncodeOptions& options) const override;
    };

} // namespace scour

#endif // SCOUR_JPEG_CODEC_HPP
