/**
 * @file png_codec.hpp
 * @brief PNG backend on libpng.
 */

#ifndef SCOUR_PNG_CODEC_HPP
#define SCOUR_PNG_CODEC_HPP

#include "codec.hpp"
#include <array>
#include <span>
#include <string_view>

namespace scour {

    /**
     * @brief Implements ICodec for PNG files using libpng.
     *
     * @details Decoding keeps the source layout where one exists (gray,
     * gray+alpha); truecolor images are widened to RGBA and palettes are
     * expanded. Encoding picks the smallest lossless color type for the
     * pixel data (palette, gray, gray+alpha, RGB or RGBA) and compresses
     * at level 9. No ancillary chunks are written; the caller adds pHYs.
     */
    class PngCodec final : public ICodec {
    public:
        [[nodiscard]] std::string_view get_name() const noexcept override {
            return "PngCodec";
        }

        [[nodiscard]] std::span<const ImageFormat> get_supported_formats() const noexcept override {
            static constexpr std::array<ImageFormat, 1> kFormats = { ImageFormat::Png };
            return {kFormats.data(), kFormats.size()};
        }

        [[nodiscard]] bool can_encode() const noexcept override { return true; }

        [[nodiscard]] ImageHeader read_header(std::span<const std::uint8_t> data) const override;

        [[nodiscard]] DecodedImage decode(std::span<const std::uint8_t> data) const override;

        [[nodiscard]] std::vector<std::uint8_t> encode(const DecodedImage& image,
                                                       const EncodeOptions& options) const override;
    };

} // namespace scour

#endif // SCOUR_PNG_CODEC_HPP
