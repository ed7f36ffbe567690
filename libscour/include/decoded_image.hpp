/**
 * @file decoded_image.hpp
 * @brief In-memory 8-bit pixel buffer with a closed layout tag.
 */

#ifndef SCOUR_DECODED_IMAGE_HPP
#define SCOUR_DECODED_IMAGE_HPP

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace scour {

/**
 * @brief Channel arrangement of a DecodedImage. 8 bits per channel,
 * interleaved, rows tightly packed.
 */
enum class PixelLayout : std::uint8_t {
    Rgba,     ///< Canonical layout
    Rgb,
    Gray,
    GrayAlpha
};

constexpr unsigned channels_of(const PixelLayout layout) noexcept {
    switch (layout) {
        case PixelLayout::Rgba:      return 4;
        case PixelLayout::Rgb:       return 3;
        case PixelLayout::Gray:      return 1;
        case PixelLayout::GrayAlpha: return 2;
    }
    return 0;
}

constexpr bool layout_has_alpha(const PixelLayout layout) noexcept {
    return layout == PixelLayout::Rgba || layout == PixelLayout::GrayAlpha;
}

const char* layout_to_string(PixelLayout layout) noexcept;

struct Rgba8 {
    std::uint8_t r = 0, g = 0, b = 0, a = 255;
    bool operator==(const Rgba8&) const = default;
};

/**
 * @brief Decoded raster owned by the worker that produced it.
 *
 * @details Pixels of any layout can be read and written as Rgba8 through
 * at()/set(); the per-layout conversion is selected once, when the image
 * is constructed, not per pixel. Copying is explicit (clone()) since
 * buffers can be hundreds of megabytes.
 */
class DecodedImage {
public:
    DecodedImage() = default;

    /// Zero-filled image.
    DecodedImage(std::uint32_t width, std::uint32_t height, PixelLayout layout);

    /**
     * @brief Adopt an existing pixel buffer.
     * @throws std::invalid_argument if pixels.size() != width * height * channels.
     */
    DecodedImage(std::uint32_t width, std::uint32_t height, PixelLayout layout,
                 std::vector<std::uint8_t> pixels);

    DecodedImage(DecodedImage&&) noexcept = default;
    DecodedImage& operator=(DecodedImage&&) noexcept = default;
    DecodedImage(const DecodedImage&) = delete;
    DecodedImage& operator=(const DecodedImage&) = delete;

    [[nodiscard]] DecodedImage clone() const;

    [[nodiscard]] std::uint32_t width() const noexcept { return width_; }
    [[nodiscard]] std::uint32_t height() const noexcept { return height_; }
    [[nodiscard]] PixelLayout layout() const noexcept { return layout_; }
    [[nodiscard]] unsigned channels() const noexcept { return channels_of(layout_); }
    [[nodiscard]] bool has_alpha() const noexcept { return layout_has_alpha(layout_); }
    [[nodiscard]] bool empty() const noexcept { return pixels_.empty(); }
    [[nodiscard]] std::size_t stride() const noexcept {
        return static_cast<std::size_t>(width_) * channels();
    }

    [[nodiscard]] std::span<std::uint8_t> pixels() noexcept { return pixels_; }
    [[nodiscard]] std::span<const std::uint8_t> pixels() const noexcept { return pixels_; }

    [[nodiscard]] std::uint8_t* row(const std::uint32_t y) noexcept {
        return pixels_.data() + static_cast<std::size_t>(y) * stride();
    }
    [[nodiscard]] const std::uint8_t* row(const std::uint32_t y) const noexcept {
        return pixels_.data() + static_cast<std::size_t>(y) * stride();
    }

    /// Pixel (x, y) widened to RGBA. No bounds check.
    [[nodiscard]] Rgba8 at(const std::uint32_t x, const std::uint32_t y) const noexcept {
        return fetch_(row(y) + static_cast<std::size_t>(x) * channels());
    }

    /// Store an RGBA value, narrowing to the layout. No bounds check.
    void set(const std::uint32_t x, const std::uint32_t y, const Rgba8 px) noexcept {
        store_(row(y) + static_cast<std::size_t>(x) * channels(), px);
    }

private:
    using Fetch = Rgba8 (*)(const std::uint8_t*) noexcept;
    using Store = void (*)(std::uint8_t*, Rgba8) noexcept;

    void bind_accessors() noexcept;

    std::uint32_t width_ = 0;
    std::uint32_t height_ = 0;
    PixelLayout layout_ = PixelLayout::Rgba;
    std::vector<std::uint8_t> pixels_;
    Fetch fetch_ = nullptr;
    Store store_ = nullptr;
};

} // namespace scour

#endif // SCOUR_DECODED_IMAGE_HPP
