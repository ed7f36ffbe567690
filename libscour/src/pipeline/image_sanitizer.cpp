#include "../../include/image_sanitizer.hpp"
#include "../../include/errors.hpp"
#include "../../include/exif_orientation.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/format_sniffer.hpp"
#include "../../include/logger.hpp"
#include "../../include/metadata_patcher.hpp"
#include "../../include/mime_detector.hpp"
#include "../../include/pixel_normalizer.hpp"
#include "../../include/placeholder.hpp"
#include <algorithm>
#include <system_error>

namespace scour {

namespace fs = std::filesystem;

namespace {

const char* tag() {
    return "image_sanitizer";
}

SanitizeStatus status_for(const std::vector<std::string>& taken) {
    const bool clean = std::ranges::all_of(taken, [](const std::string& a) { return actions::is_baseline(a); });
    return clean ? SanitizeStatus::Ok : SanitizeStatus::Repaired;
}

/// JFIF densities are 16-bit.
std::uint16_t jfif_density(const std::uint32_t dpi) {
    return static_cast<std::uint16_t>(std::min<std::uint32_t>(dpi, 0xFFFF));
}

std::string describe_unknown(const fs::path& path) {
    const std::string mime = MimeDetector::detect(path);
    const std::string desc = MimeDetector::describe(path);
    if (mime.empty() && desc.empty()) return {};
    std::string out = " [libmagic: " + mime;
    if (!desc.empty()) out += (mime.empty() ? "" : ", ") + desc;
    return out + "]";
}

} // namespace

ImageSanitizer::ImageSanitizer(const CodecRegistry& registry, SanitizeConfig config)
    : registry_(registry),
      config_(config),
      decoder_(registry, config.limits, config.stream_buffer_size) {}

bool ImageSanitizer::fast_path_eligible(const fs::path& path, const ImageFormat sniffed,
                                        const std::optional<int> orientation) const {
    if (!config_.enable_fast_path) return false;
    const std::string ext = lower_extension(path);
    if (ext != ".jpg" && ext != ".jpeg") return false;
    if (sniffed != ImageFormat::Jpeg) return false;
    return orientation.value_or(1) <= 1;
}

SanitizationReport ImageSanitizer::sanitize(const fs::path& path) const {
    SanitizationReport report;
    report.path = path;
    std::error_code ec;
    report.size_before = fs::file_size(path, ec);
    if (ec) report.size_before = 0;

    ImageFormat format = ImageFormat::Unknown;
    try {
        format = FormatSniffer::sniff(path);
    } catch (const FormatUnknownError& e) {
        Logger::log(LogLevel::Warning, "Unidentified image " + path.string() + ": " + e.what(), tag());
        replace_with_placeholder(report, actions::kInvalidReplaced, SanitizeStatus::Failed,
                                 e.what() + describe_unknown(path));
        return report;
    }
    report.original_format = image_format_to_string(format);

    if (auto spoof = FormatSniffer::detect_spoof(path, format)) {
        report.actions.push_back(std::move(*spoof));
    }

    std::vector<std::uint8_t> bytes;
    try {
        bytes = read_file_capped(path, config_.limits.max_decompressed_size, config_.stream_buffer_size);
    } catch (const DecodeError& e) {
        Logger::log(LogLevel::Warning, "Cannot read " + path.string() + ": " + e.what(), tag());
        replace_with_placeholder(report, actions::kDecodeFailReplaced, SanitizeStatus::Replaced, e.what());
        return report;
    }

    const auto orientation = read_exif_orientation(bytes, format);
    if (fast_path_eligible(path, format, orientation)) {
        run_fast_path(report, std::move(bytes));
    } else {
        run_full_pipeline(report, bytes, format, orientation);
    }
    return report;
}

void ImageSanitizer::run_fast_path(SanitizationReport& report, std::vector<std::uint8_t> bytes) const {
    try {
        const auto patched = metadata::inject_jfif_dpi(std::move(bytes), jfif_density(config_.target_dpi));
        write_file_atomic(report.path, patched);
        report.size_after = patched.size();
    } catch (const ReencodeError& e) {
        Logger::log(LogLevel::Error, "Fast path write failed for " + report.path.string() + ": " + e.what(), tag());
        replace_with_placeholder(report, actions::kReencodeFailed, SanitizeStatus::Failed, e.what());
        return;
    }
    report.actions.push_back(actions::fast_dpi(config_.target_dpi));
    report.status = status_for(report.actions);
    Logger::log(LogLevel::Debug, "Fast path: " + report.path.string(), tag());
}

void ImageSanitizer::run_full_pipeline(SanitizationReport& report, std::span<const std::uint8_t> bytes,
                                       const ImageFormat format, const std::optional<int> orientation) const {
    DecodedImage image;
    try {
        image = decoder_.decode_bytes(bytes, format);
    } catch (const DecodeError& e) {
        Logger::log(LogLevel::Warning, "Decode failed for " + report.path.string() + ": " + e.what(), tag());
        replace_with_placeholder(report, actions::kDecodeFailReplaced, SanitizeStatus::Replaced, e.what());
        return;
    }

    report.actions.push_back(PixelNormalizer::exif_rotate(image, orientation));
    if (auto action = PixelNormalizer::normalize_color_space(image)) report.actions.push_back(std::move(*action));
    if (auto action = PixelNormalizer::flatten_alpha(image)) report.actions.push_back(std::move(*action));
    if (auto action = PixelNormalizer::resize_long_side(image, config_.max_long_side)) {
        report.actions.push_back(std::move(*action));
    }

    try {
        const auto encoded = encode_for(report.path, image);
        image = DecodedImage{};
        write_file_atomic(report.path, encoded);
        report.size_after = encoded.size();
    } catch (const ReencodeError& e) {
        Logger::log(LogLevel::Error, "Re-encode failed for " + report.path.string() + ": " + e.what(), tag());
        replace_with_placeholder(report, actions::kReencodeFailed, SanitizeStatus::Failed, e.what());
        return;
    }

    report.actions.push_back(actions::force_dpi(config_.target_dpi));
    report.actions.emplace_back(actions::kCleanBinary);
    report.status = status_for(report.actions);
}

std::vector<std::uint8_t> ImageSanitizer::encode_for(const fs::path& path, const DecodedImage& image) const {
    const bool as_png = lower_extension(path) == ".png";
    const ImageFormat target = as_png ? ImageFormat::Png : ImageFormat::Jpeg;
    const ICodec* codec = registry_.find_encoder(target);
    if (!codec) {
        throw ReencodeError("no encoder for " + image_format_to_string(target));
    }

    auto encoded = codec->encode(image, EncodeOptions{config_.jpeg_quality});
    if (as_png) {
        return metadata::inject_png_phys(std::move(encoded), config_.target_dpi);
    }
    return metadata::inject_jfif_dpi(std::move(encoded), jfif_density(config_.target_dpi));
}

void ImageSanitizer::replace_with_placeholder(SanitizationReport& report, const std::string_view action,
                                              const SanitizeStatus status, const std::string& error) {
    report.actions.emplace_back(action);
    report.status = status;
    report.error = error;
    try {
        const auto svg = PlaceholderSubstitutor::substitute(report.path);
        std::error_code ec;
        report.size_after = fs::file_size(svg, ec);
        if (ec) report.size_after = 0;
    } catch (const ReencodeError& e) {
        Logger::log(LogLevel::Error, "Placeholder failed for " + report.path.string() + ": " + e.what(), tag());
        report.error = error + "; placeholder: " + e.what();
    }
}

} // namespace scour
