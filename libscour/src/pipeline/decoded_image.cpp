#include "../../include/decoded_image.hpp"
#include <stdexcept>
#include <string>
#include <utility>

namespace scour {

namespace {

Rgba8 fetch_rgba(const std::uint8_t* p) noexcept { return {p[0], p[1], p[2], p[3]}; }
Rgba8 fetch_rgb(const std::uint8_t* p) noexcept { return {p[0], p[1], p[2], 255}; }
Rgba8 fetch_gray(const std::uint8_t* p) noexcept { return {p[0], p[0], p[0], 255}; }
Rgba8 fetch_gray_alpha(const std::uint8_t* p) noexcept { return {p[0], p[0], p[0], p[1]}; }

// ITU-R BT.601 luma, integer weights summing to 1000
std::uint8_t luma(const Rgba8 px) noexcept {
    return static_cast<std::uint8_t>((299u * px.r + 587u * px.g + 114u * px.b + 500u) / 1000u);
}

void store_rgba(std::uint8_t* p, const Rgba8 px) noexcept { p[0] = px.r; p[1] = px.g; p[2] = px.b; p[3] = px.a; }
void store_rgb(std::uint8_t* p, const Rgba8 px) noexcept { p[0] = px.r; p[1] = px.g; p[2] = px.b; }
void store_gray(std::uint8_t* p, const Rgba8 px) noexcept { p[0] = luma(px); }
void store_gray_alpha(std::uint8_t* p, const Rgba8 px) noexcept { p[0] = luma(px); p[1] = px.a; }

} // namespace

const char* layout_to_string(const PixelLayout layout) noexcept {
    switch (layout) {
        case PixelLayout::Rgba:      return "RGBA";
        case PixelLayout::Rgb:       return "RGB";
        case PixelLayout::Gray:      return "Gray";
        case PixelLayout::GrayAlpha: return "GrayAlpha";
    }
    return "";
}

DecodedImage::DecodedImage(const std::uint32_t width, const std::uint32_t height, const PixelLayout layout)
    : width_(width), height_(height), layout_(layout),
      pixels_(static_cast<std::size_t>(width) * height * channels_of(layout)) {
    bind_accessors();
}

DecodedImage::DecodedImage(const std::uint32_t width, const std::uint32_t height, const PixelLayout layout,
                           std::vector<std::uint8_t> pixels)
    : width_(width), height_(height), layout_(layout), pixels_(std::move(pixels)) {
    const std::size_t expected = static_cast<std::size_t>(width) * height * channels_of(layout);
    if (pixels_.size() != expected) {
        throw std::invalid_argument("pixel buffer holds " + std::to_string(pixels_.size()) +
                                    " bytes, expected " + std::to_string(expected));
    }
    bind_accessors();
}

DecodedImage DecodedImage::clone() const {
    return DecodedImage(width_, height_, layout_, pixels_);
}

void DecodedImage::bind_accessors() noexcept {
    switch (layout_) {
        case PixelLayout::Rgba:      fetch_ = fetch_rgba;       store_ = store_rgba;       break;
        case PixelLayout::Rgb:       fetch_ = fetch_rgb;        store_ = store_rgb;        break;
        case PixelLayout::Gray:      fetch_ = fetch_gray;       store_ = store_gray;       break;
        case PixelLayout::GrayAlpha: fetch_ = fetch_gray_alpha; store_ = store_gray_alpha; break;
    }
}

} // namespace scour
