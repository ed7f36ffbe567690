/**
 * @file stb_codec.hpp
 * @brief Decode-only GIF/BMP backend on stb_image.
 */

#ifndef SCOUR_STB_CODEC_HPP
#define SCOUR_STB_CODEC_HPP

#include "codec.hpp"
#include <array>
#include <span>
#include <string_view>

namespace scour {

    class StbCodec final : public ICodec {
    public:
        [[nodiscard]] std::string_view get_name() const noexcept override {
            return "StbCodec";
        }

        [[nodiscard]] std::span<const ImageFormat> get_supported_formats() const noexcept override {
            static constexpr std::array<ImageFormat, 2> kFormats = { ImageFormat::Gif, ImageFormat::Bmp };
            return {kFormats.data(), kFormats.size()};
        }

        [[nodiscard]] bool can_encode() const noexcept override { return false; }

        [[nodiscard]] ImageHeader read_header(std::span<const std::uint8_t> data) const override;

        [[nodiscard]] DecodedImage decode(std::span<const std::uint8_t> data) const override;

        [[nodiscard]] std::vector<std::uint8_t> encode(const DecodedImage& image,
                                                       const EncodeOptions& options) const override;
    };

} // namespace scour

#endif // SCOUR_STB_CODEC_HPP
