#include "../../include/placeholder.hpp"
#include "../../include/errors.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <span>
#include <system_error>

namespace scour {

std::filesystem::path PlaceholderSubstitutor::placeholder_path(const std::filesystem::path& original) {
    auto svg = original;
    svg.replace_extension(".svg");
    return svg;
}

std::filesystem::path PlaceholderSubstitutor::substitute(const std::filesystem::path& original) {
    const auto svg = placeholder_path(original);
    write_file_atomic(svg, std::span(reinterpret_cast<const std::uint8_t*>(kPlaceholderSvg.data()),
                                     kPlaceholderSvg.size()));

    if (svg != original) {
        std::error_code ec;
        std::filesystem::remove(original, ec);
        if (ec) {
            Logger::log(LogLevel::Error, "Cannot remove " + original.string() + ": " + ec.message(), "placeholder");
            throw ReencodeError("cannot remove " + original.string() + ": " + ec.message());
        }
    }
    Logger::log(LogLevel::Info, "Placeholder written: " + svg.string(), "placeholder");
    return svg;
}

} // namespace scour
