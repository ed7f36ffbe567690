/**
 * @file sanitization_report.hpp
 * @brief Per-file outcome of a sanitization pass and the aggregate counts.
 */

#ifndef SCOUR_SANITIZATION_REPORT_HPP
#define SCOUR_SANITIZATION_REPORT_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace scour {

/**
 * @brief Final state of one image file.
 */
enum class SanitizeStatus {
    Ok,       ///< Only the baseline metadata patch was applied
    Repaired, ///< Pixels or container were corrected and re-encoded
    Replaced, ///< Undecodable; the file was swapped for the placeholder SVG
    Failed    ///< Unidentifiable or could not be re-encoded; placeholder written
};

inline const char* status_to_string(const SanitizeStatus status) {
    switch (status) {
        case SanitizeStatus::Ok:       return "OK";
        case SanitizeStatus::Repaired: return "REPAIRED";
        case SanitizeStatus::Replaced: return "REPLACED";
        case SanitizeStatus::Failed:   return "FAILED";
    }
    return "";
}

/**
 * @brief Outcome of sanitizing one file.
 *
 * `actions` keeps the tags in the order the pipeline took them.
 */
struct SanitizationReport {
    std::filesystem::path path;
    std::string original_format;           ///< Sniffed format, "" if sniffing failed
    std::vector<std::string> actions;
    SanitizeStatus status = SanitizeStatus::Ok;
    std::optional<std::string> error;
    std::uintmax_t size_before = 0;        ///< bytes
    std::uintmax_t size_after = 0;         ///< bytes

    bool operator==(const SanitizationReport&) const = default;
};

/**
 * @brief Read-only counts per status over a list of reports.
 */
struct AggregateStats {
    std::size_t total = 0;
    std::size_t ok = 0;
    std::size_t repaired = 0;
    std::size_t replaced = 0;
    std::size_t failed = 0;
    std::uintmax_t bytes_before = 0;
    std::uintmax_t bytes_after = 0;

    static AggregateStats from(std::span<const SanitizationReport> reports);

    bool operator==(const AggregateStats&) const = default;
};

/**
 * @brief Action tags recorded in SanitizationReport::actions.
 */
namespace actions {

inline constexpr std::string_view kExifStripped = "EXIF_STRIPPED";
inline constexpr std::string_view kExifFlipH = "EXIF_FLIP_H";
inline constexpr std::string_view kExifRot180 = "EXIF_ROT_180";
inline constexpr std::string_view kExifFlipV = "EXIF_FLIP_V";
inline constexpr std::string_view kExifTranspose = "EXIF_TRANSPOSE";
inline constexpr std::string_view kExifRot270 = "EXIF_ROT_270";
inline constexpr std::string_view kExifTransverse = "EXIF_TRANSVERSE";
inline constexpr std::string_view kExifRot90 = "EXIF_ROT_90";
inline constexpr std::string_view kForceSrgb = "FORCE_sRGB";
inline constexpr std::string_view kAlphaFlatWhite = "ALPHA_FLAT_WHITE";
inline constexpr std::string_view kCleanBinary = "CLEAN_BINARY";
inline constexpr std::string_view kInvalidReplaced = "INVALID_REPLACED";
inline constexpr std::string_view kDecodeFailReplaced = "DECODE_FAIL_REPLACED";
inline constexpr std::string_view kReencodeFailed = "REENCODE_FAILED";

/// `FORCE_{dpi}DPI`
std::string force_dpi(std::uint32_t dpi);
/// `FAST_{dpi}DPI`
std::string fast_dpi(std::uint32_t dpi);
/// `SPOOF_{claimed}→{real}`, claimed being the format the extension maps to
std::string spoof(std::string_view claimed, std::string_view real);
/// `RESIZE_{w}x{h}→{w'}x{h'}`
std::string resize(std::uint32_t w, std::uint32_t h, std::uint32_t new_w, std::uint32_t new_h);

/**
 * @brief True for tags every clean file gets (metadata drop and DPI patch).
 * A report whose actions are all baseline ends up OK.
 */
bool is_baseline(std::string_view action);

} // namespace actions

} // namespace scour

#endif // SCOUR_SANITIZATION_REPORT_HPP
