#include "../../include/exif_orientation.hpp"
#include <cstring>

namespace scour {

namespace {

constexpr std::uint16_t kOrientationTag = 0x0112;
constexpr std::uint16_t kTypeShort = 3;

std::uint16_t be16(const std::uint8_t* p) { return static_cast<std::uint16_t>((p[0] << 8) | p[1]); }

std::uint32_t be32(const std::uint8_t* p) {
    return (static_cast<std::uint32_t>(p[0]) << 24) | (static_cast<std::uint32_t>(p[1]) << 16) |
           (static_cast<std::uint32_t>(p[2]) << 8) | p[3];
}

std::uint32_t le32(const std::uint8_t* p) {
    return (static_cast<std::uint32_t>(p[3]) << 24) | (static_cast<std::uint32_t>(p[2]) << 16) |
           (static_cast<std::uint32_t>(p[1]) << 8) | p[0];
}

/// Skips an optional "Exif\0\0" prefix in front of the TIFF header.
std::span<const std::uint8_t> strip_exif_prefix(std::span<const std::uint8_t> data) {
    if (data.size() >= 6 && std::memcmp(data.data(), "Exif\0\0", 6) == 0) return data.subspan(6);
    return data;
}

std::optional<int> from_jpeg(std::span<const std::uint8_t> d) {
    if (d.size() < 4 || d[0] != 0xFF || d[1] != 0xD8) return std::nullopt;
    std::size_t i = 2;
    while (i + 4 <= d.size()) {
        if (d[i] != 0xFF) return std::nullopt;
        const std::uint8_t marker = d[i + 1];
        if (marker == 0xFF) { ++i; continue; }                    // fill byte
        if (marker == 0x01 || (marker >= 0xD0 && marker <= 0xD8)) { i += 2; continue; }
        if (marker == 0xDA || marker == 0xD9) return std::nullopt; // SOS / EOI: no more headers
        const std::uint16_t len = be16(&d[i + 2]);
        if (len < 2 || i + 2 + len > d.size()) return std::nullopt;
        if (marker == 0xE1 && len >= 8 && std::memcmp(&d[i + 4], "Exif\0\0", 6) == 0) {
            return read_tiff_orientation(d.subspan(i + 10, len - 8));
        }
        i += 2 + len;
    }
    return std::nullopt;
}

std::optional<int> from_png(std::span<const std::uint8_t> d) {
    if (d.size() < 8 || d[0] != 0x89 || std::memcmp(&d[1], "PNG", 3) != 0) return std::nullopt;
    std::size_t off = 8;
    while (off + 12 <= d.size()) {
        const std::uint32_t len = be32(&d[off]);
        if (len > d.size() - off - 12) return std::nullopt;
        const std::uint8_t* type = &d[off + 4];
        if (std::memcmp(type, "eXIf", 4) == 0) {
            return read_tiff_orientation(strip_exif_prefix(d.subspan(off + 8, len)));
        }
        if (std::memcmp(type, "IEND", 4) == 0) break;
        off += 12 + static_cast<std::size_t>(len);
    }
    return std::nullopt;
}

std::optional<int> from_webp(std::span<const std::uint8_t> d) {
    if (d.size() < 12 || std::memcmp(d.data(), "RIFF", 4) != 0 || std::memcmp(&d[8], "WEBP", 4) != 0) {
        return std::nullopt;
    }
    std::size_t off = 12;
    while (off + 8 <= d.size()) {
        const std::uint32_t size = le32(&d[off + 4]);
        if (size > d.size() - off - 8) return std::nullopt;
        if (std::memcmp(&d[off], "EXIF", 4) == 0) {
            return read_tiff_orientation(strip_exif_prefix(d.subspan(off + 8, size)));
        }
        off += 8 + static_cast<std::size_t>(size) + (size & 1u); // chunks are padded to even size
    }
    return std::nullopt;
}

} // namespace

std::optional<int> read_tiff_orientation(std::span<const std::uint8_t> t) {
    if (t.size() < 8) return std::nullopt;

    bool little = false;
    if (t[0] == 'I' && t[1] == 'I') little = true;
    else if (t[0] != 'M' || t[1] != 'M') return std::nullopt;

    const auto u16 = [&](const std::size_t at) -> std::uint16_t {
        return little ? static_cast<std::uint16_t>(t[at] | (t[at + 1] << 8)) : be16(&t[at]);
    };
    const auto u32 = [&](const std::size_t at) -> std::uint32_t {
        return little ? le32(&t[at]) : be32(&t[at]);
    };

    if (u16(2) != 42) return std::nullopt;
    const std::uint32_t ifd = u32(4);
    if (ifd < 8 || ifd > t.size() - 2) return std::nullopt;

    const std::uint16_t count = u16(ifd);
    for (std::uint32_t n = 0; n < count; ++n) {
        const std::size_t entry = ifd + 2 + static_cast<std::size_t>(n) * 12;
        if (entry + 12 > t.size()) return std::nullopt;
        if (u16(entry) != kOrientationTag) continue;
        if (u16(entry + 2) != kTypeShort || u32(entry + 4) != 1) return std::nullopt;
        const int value = u16(entry + 8); // SHORT is left-justified in the value field
        if (value < 1 || value > 8) return std::nullopt;
        return value;
    }
    return std::nullopt;
}

std::optional<int> read_exif_orientation(std::span<const std::uint8_t> file, const ImageFormat format) {
    switch (format) {
        case ImageFormat::Jpeg: return from_jpeg(file);
        case ImageFormat::Png:  return from_png(file);
        case ImageFormat::Webp: return from_webp(file);
        case ImageFormat::Tiff: return read_tiff_orientation(file);
        default:                return std::nullopt;
    }
}

} // namespace scour
