/**
 * @file image_sanitizer.hpp
 * @brief Per-file sanitization pipeline.
 */

#ifndef SCOUR_IMAGE_SANITIZER_HPP
#define SCOUR_IMAGE_SANITIZER_HPP

#include "codec_registry.hpp"
#include "decoded_image.hpp"
#include "image_format.hpp"
#include "safe_decoder.hpp"
#include "sanitization_report.hpp"
#include "sanitize_config.hpp"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace scour {

    /**
     * @brief Sanitizes one image file in place.
     *
     * @details Order per file: sniff, spoof check, fast path (clean JPEGs
     * only), bounded decode, EXIF rotation, RGBA canonicalization, alpha
     * flattening, downsampling, re-encode with DPI patch, atomic replace.
     * Unidentifiable, undecodable or unwritable files are replaced by the
     * placeholder SVG. Stateless; one instance is shared by all workers.
     */
    class ImageSanitizer {
    public:
        ImageSanitizer(const CodecRegistry& registry, SanitizeConfig config);

        /**
         * @brief Run the pipeline on one file.
         * Never throws for per-file problems; they end up in the report.
         */
        [[nodiscard]] SanitizationReport sanitize(const std::filesystem::path& path) const;

        /**
         * @brief Whether a file only needs the JFIF density patch.
         * @param path File name (its extension is checked).
         * @param sniffed Format detected from the content.
         * @param orientation EXIF orientation read from the content.
         */
        [[nodiscard]] bool fast_path_eligible(const std::filesystem::path& path,
                                              ImageFormat sniffed,
                                              std::optional<int> orientation) const;

        /**
         * @brief Encode a normalized image and apply the DPI patch.
         * `.png` targets become PNG, every other extension JPEG.
         * @throws ReencodeError
         */
        [[nodiscard]] std::vector<std::uint8_t> encode_for(const std::filesystem::path& path,
                                                           const DecodedImage& image) const;

        [[nodiscard]] const SanitizeConfig& config() const noexcept { return config_; }

    private:
        void run_fast_path(SanitizationReport& report, std::vector<std::uint8_t> bytes) const;
        void run_full_pipeline(SanitizationReport& report, std::span<const std::uint8_t> bytes,
                               ImageFormat format, std::optional<int> orientation) const;
        static void replace_with_placeholder(SanitizationReport& report, std::string_view action,
                                             SanitizeStatus status, const std::string& error);

        const CodecRegistry& registry_;
        SanitizeConfig config_;
        SafeDecoder decoder_;
    };

} // namespace scour

#endif // SCOUR_IMAGE_SANITIZER_HPP
