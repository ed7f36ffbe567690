#include "../../include/sanitization_report.hpp"

namespace scour {

AggregateStats AggregateStats::from(std::span<const SanitizationReport> reports) {
    AggregateStats stats;
    for (const auto& r : reports) {
        ++stats.total;
        stats.bytes_before += r.size_before;
        stats.bytes_after += r.size_after;
        switch (r.status) {
            case SanitizeStatus::Ok:       ++stats.ok; break;
            case SanitizeStatus::Repaired: ++stats.repaired; break;
            case SanitizeStatus::Replaced: ++stats.replaced; break;
            case SanitizeStatus::Failed:   ++stats.failed; break;
        }
    }
    return stats;
}

namespace actions {

std::string force_dpi(const std::uint32_t dpi) {
    return "FORCE_" + std::to_string(dpi) + "DPI";
}

std::string fast_dpi(const std::uint32_t dpi) {
    return "FAST_" + std::to_string(dpi) + "DPI";
}

std::string spoof(const std::string_view claimed, const std::string_view real) {
    return "SPOOF_" + std::string(claimed) + "→" + std::string(real);
}

std::string resize(const std::uint32_t w, const std::uint32_t h,
                   const std::uint32_t new_w, const std::uint32_t new_h) {
    return "RESIZE_" + std::to_string(w) + "x" + std::to_string(h) + "→" +
           std::to_string(new_w) + "x" + std::to_string(new_h);
}

bool is_baseline(const std::string_view action) {
    if (action == kExifStripped || action == kCleanBinary) return true;
    // FORCE_<n>DPI / FAST_<n>DPI
    for (const std::string_view prefix : {std::string_view("FORCE_"), std::string_view("FAST_")}) {
        if (action.starts_with(prefix) && action.ends_with("DPI") &&
            action.size() > prefix.size() + 3) {
            const auto digits = action.substr(prefix.size(), action.size() - prefix.size() - 3);
            bool all_digits = true;
            for (const char c : digits) {
                if (c < '0' || c > '9') { all_digits = false; break; }
            }
            if (all_digits) return true;
        }
    }
    return false;
}

} // namespace actions

} // namespace scour
