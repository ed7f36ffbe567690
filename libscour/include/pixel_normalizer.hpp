/**
 * @file pixel_normalizer.hpp
 * @brief The four pixel normalization steps applied after decoding.
 */

#ifndef SCOUR_PIXEL_NORMALIZER_HPP
#define SCOUR_PIXEL_NORMALIZER_HPP

#include "decoded_image.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace scour {

    /**
     * @brief Independent, composable pixel transforms.
     *
     * @details Each step mutates the image in place and returns the action tag
     * it took, or nothing when the image was left alone. The sanitizer runs
     * them in a fixed order: exif_rotate, normalize_color_space, flatten_alpha,
     * resize_long_side.
     */
    class PixelNormalizer {
    public:
        /// Images above this many pixels are sampled on a 10-pixel grid by flatten_alpha.
        static constexpr std::uint64_t kFullScanArea = 1'000'000;
        static constexpr std::uint32_t kSampleStride = 10;

        /**
         * @brief Undo the EXIF orientation.
         * @param orientation Tag value 1-8, nothing if absent or unreadable.
         * @return Always a tag: `EXIF_STRIPPED` when no transform was needed.
         */
        static std::string exif_rotate(DecodedImage& image, std::optional<int> orientation);

        /**
         * @brief Redraw non-RGBA images on an RGBA canvas.
         * @return `FORCE_sRGB`, or nothing if the image already was RGBA.
         */
        static std::optional<std::string> normalize_color_space(DecodedImage& image);

        /**
         * @brief Composite onto opaque white if any sampled pixel is translucent.
         * @return `ALPHA_FLAT_WHITE`, or nothing.
         */
        static std::optional<std::string> flatten_alpha(DecodedImage& image);

        /**
         * @brief Lanczos-3 downsample so the long side equals max_long_side.
         * @return `RESIZE_{w}x{h}→{w'}x{h'}`, or nothing if already small enough
         * or max_long_side is 0.
         */
        static std::optional<std::string> resize_long_side(DecodedImage& image, std::uint32_t max_long_side);

        // --- geometric primitives (rotation names are counter-clockwise) ---

        [[nodiscard]] static DecodedImage flip_horizontal(const DecodedImage& src);
        [[nodiscard]] static DecodedImage flip_vertical(const DecodedImage& src);
        [[nodiscard]] static DecodedImage rotate90(const DecodedImage& src);
        [[nodiscard]] static DecodedImage rotate180(const DecodedImage& src);
        [[nodiscard]] static DecodedImage rotate270(const DecodedImage& src);
        [[nodiscard]] static DecodedImage transpose(const DecodedImage& src);
        [[nodiscard]] static DecodedImage transverse(const DecodedImage& src);

        /**
         * @brief Resample to an exact size with a separable Lanczos-3 filter.
         */
        [[nodiscard]] static DecodedImage resize_lanczos3(const DecodedImage& src,
                                                          std::uint32_t new_width,
                                                          std::uint32_t new_height);
    };

} // namespace scour

#endif // SCOUR_PIXEL_NORMALIZER_HPP
