#include "../../include/stb_codec.hpp"
#include "../../include/errors.hpp"
// single translation unit holding the stb_image implementation, GIF and BMP only
#define STB_IMAGE_IMPLEMENTATION
#define STBI_ONLY_GIF
#define STBI_ONLY_BMP
#define STBI_NO_STDIO
#include <stb_image.h>
#include <climits>
#include <cstring>
#include <memory>
#include <string>

namespace scour {

namespace {

struct StbiFree {
    void operator()(stbi_uc* p) const { if (p) stbi_image_free(p); }
};

int checked_length(std::span<const std::uint8_t> data) {
    if (data.empty() || data.size() > static_cast<std::size_t>(INT_MAX)) {
        throw DecodeError("stb_image: unsupported input size");
    }
    return static_cast<int>(data.size());
}

PixelLayout layout_for_components(const int comp) {
    switch (comp) {
        case 1: return PixelLayout::Gray;
        case 2: return PixelLayout::GrayAlpha;
        case 3: return PixelLayout::Rgb;
        case 4: return PixelLayout::Rgba;
        default: throw DecodeError("stb_image: unexpected channel count " + std::to_string(comp));
    }
}

std::string failure_reason() {
    const char* reason = stbi_failure_reason();
    return reason ? reason : "unknown error";
}

} // namespace

ImageHeader StbCodec::read_header(std::span<const std::uint8_t> data) const {
    int x = 0, y = 0, comp = 0;
    if (!stbi_info_from_memory(data.data(), checked_length(data), &x, &y, &comp)) {
        throw DecodeError("stb_image: " + failure_reason());
    }
    return {x, y};
}

DecodedImage StbCodec::decode(std::span<const std::uint8_t> data) const {
    int x = 0, y = 0, comp = 0;
    // GIF: first frame only
    const std::unique_ptr<stbi_uc, StbiFree> pixels(
        stbi_load_from_memory(data.data(), checked_length(data), &x, &y, &comp, 0));
    if (!pixels) {
        throw DecodeError("stb_image: " + failure_reason());
    }

    DecodedImage image(static_cast<std::uint32_t>(x), static_cast<std::uint32_t>(y), layout_for_components(comp));
    std::memcpy(image.pixels().data(), pixels.get(), image.pixels().size());
    return image;
}

std::vector<std::uint8_t> StbCodec::encode(const DecodedImage&, const EncodeOptions&) const {
    throw ReencodeError("StbCodec does not encode");
}

} // namespace scour
