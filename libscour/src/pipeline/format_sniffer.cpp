#include "../../include/format_sniffer.hpp"
#include "../../include/errors.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/sanitization_report.hpp"
#include <algorithm>
#include <array>
#include <cstdio>
#include <cstring>
#include <memory>
#include <vector>

namespace scour {

namespace {

struct FileCloser {
    void operator()(FILE* f) const { if (f) std::fclose(f); }
};
using unique_FILE = std::unique_ptr<FILE, FileCloser>;

bool starts_with(std::span<const std::uint8_t> data, const char* sig, const std::size_t len) {
    return data.size() >= len && std::memcmp(data.data(), sig, len) == 0;
}

std::string hex_magic(std::span<const std::uint8_t> data) {
    static constexpr char kDigits[] = "0123456789ABCDEF";
    std::string out;
    for (const auto b : data) {
        out += kDigits[b >> 4];
        out += kDigits[b & 0x0F];
    }
    return out;
}

} // namespace

ImageFormat FormatSniffer::sniff(const std::filesystem::path& path) {
    const unique_FILE fp(open_file(path, "rb"));
    if (!fp) {
        Logger::log(LogLevel::Warning, "Cannot open for sniffing: " + path.string(), "format_sniffer");
        throw FormatUnknownError("cannot open file", {});
    }
    std::array<std::uint8_t, kHeaderSize> header{};
    const std::size_t n = std::fread(header.data(), 1, header.size(), fp.get());
    return sniff_bytes(std::span<const std::uint8_t>(header.data(), n));
}

ImageFormat FormatSniffer::sniff_bytes(std::span<const std::uint8_t> header) {
    if (header.size() < 2) {
        throw FormatUnknownError("file too small", {header.begin(), header.end()});
    }
    const auto h = header.first(std::min(header.size(), kHeaderSize));

    if (h.size() >= 3 && h[0] == 0xFF && h[1] == 0xD8 && h[2] == 0xFF) return ImageFormat::Jpeg;
    if (h.size() >= 4 && h[0] == 0x89 && h[1] == 'P' && h[2] == 'N' && h[3] == 'G') return ImageFormat::Png;
    if (starts_with(h, "GIF87a", 6) || starts_with(h, "GIF89a", 6)) return ImageFormat::Gif;
    if (h.size() >= 12 && starts_with(h, "RIFF", 4) && std::memcmp(h.data() + 8, "WEBP", 4) == 0) {
        return ImageFormat::Webp;
    }
    if (h[0] == 'B' && h[1] == 'M') return ImageFormat::Bmp;
    if (starts_with(h, "II\x2A\x00", 4) || starts_with(h, "MM\x00\x2A", 4)) return ImageFormat::Tiff;

    const auto magic = h.first(std::min<std::size_t>(h.size(), 4));
    throw FormatUnknownError("unknown format (magic: " + hex_magic(magic) + ")",
                             {magic.begin(), magic.end()});
}

std::optional<std::string> FormatSniffer::detect_spoof(const std::filesystem::path& path, const ImageFormat real) {
    const auto claimed = format_from_extension(path);
    if (!claimed || *claimed == real) return std::nullopt;

    Logger::log(LogLevel::Warning,
                "Extension spoofing: " + path.string() + " claims " + image_format_to_string(*claimed) +
                " but is " + image_format_to_string(real),
                "format_sniffer");
    return actions::spoof(image_format_to_string(*claimed), image_format_to_string(real));
}

} // namespace scour
