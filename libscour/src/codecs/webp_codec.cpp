#include "../../include/webp_codec.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <webp/decode.h>
#include <string>

namespace scour {

ImageHeader WebpCodec::read_header(std::span<const std::uint8_t> data) const {
    int width = 0, height = 0;
    if (!WebPGetInfo(data.data(), data.size(), &width, &height)) {
        throw DecodeError("libwebp: cannot parse WebP header");
    }
    return {width, height};
}

DecodedImage WebpCodec::decode(std::span<const std::uint8_t> data) const {
    WebPBitstreamFeatures features;
    if (WebPGetFeatures(data.data(), data.size(), &features) != VP8_STATUS_OK) {
        throw DecodeError("libwebp: feature detection failed");
    }
    if (features.has_animation) {
        Logger::log(LogLevel::Debug, "Animated WebP, only the first frame is kept", "webp_codec");
    }

    const PixelLayout layout = features.has_alpha ? PixelLayout::Rgba : PixelLayout::Rgb;
    DecodedImage image(static_cast<std::uint32_t>(features.width),
                       static_cast<std::uint32_t>(features.height), layout);
    const auto out = image.pixels();
    const int stride = static_cast<int>(image.stride());

    const std::uint8_t* res = features.has_alpha
        ? WebPDecodeRGBAInto(data.data(), data.size(), out.data(), out.size(), stride)
        : WebPDecodeRGBInto(data.data(), data.size(), out.data(), out.size(), stride);
    if (!res) {
        throw DecodeError(std::string("libwebp: decode failed (") + (features.has_alpha ? "RGBA" : "RGB") + ")");
    }
    return image;
}

std::vector<std::uint8_t> WebpCodec::encode(const DecodedImage&, const EncodeOptions&) const {
    throw ReencodeError("WebpCodec does not encode");
}

} // namespace scour
