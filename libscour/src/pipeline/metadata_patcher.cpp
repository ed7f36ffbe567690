#include "../../include/metadata_patcher.hpp"
#include "../../include/logger.hpp"
#include <zlib.h>
#include <algorithm>
#include <array>
#include <cmath>
#include <cstring>
#include <string>

namespace scour::metadata {

namespace {

void put_be16(std::uint8_t* p, const std::uint16_t v) {
    p[0] = static_cast<std::uint8_t>(v >> 8);
    p[1] = static_cast<std::uint8_t>(v);
}

void put_be32(std::uint8_t* p, const std::uint32_t v) {
    p[0] = static_cast<std::uint8_t>(v >> 24);
    p[1] = static_cast<std::uint8_t>(v >> 16);
    p[2] = static_cast<std::uint8_t>(v >> 8);
    p[3] = static_cast<std::uint8_t>(v);
}

std::uint32_t get_be32(const std::uint8_t* p) {
    return (static_cast<std::uint32_t>(p[0]) << 24) | (static_cast<std::uint32_t>(p[1]) << 16) |
           (static_cast<std::uint32_t>(p[2]) << 8) | p[3];
}

constexpr std::array<std::uint8_t, 8> kPngSignature = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};

/// Offset of the JFIF APP0 marker, or npos.
std::size_t find_jfif_app0(const std::vector<std::uint8_t>& d) {
    std::size_t i = 2;
    while (i + 4 <= d.size()) {
        if (d[i] != 0xFF) break;
        const std::uint8_t marker = d[i + 1];
        if (marker == 0xFF) { ++i; continue; }
        if (marker == 0x01 || (marker >= 0xD0 && marker <= 0xD8)) { i += 2; continue; }
        if (marker == 0xDA || marker == 0xD9) break;
        const std::size_t len = (static_cast<std::size_t>(d[i + 2]) << 8) | d[i + 3];
        if (len < 2 || i + 2 + len > d.size()) break;
        if (marker == 0xE0 && len >= 16 && std::memcmp(&d[i + 4], "JFIF\0", 5) == 0) return i;
        i += 2 + len;
    }
    return std::string::npos;
}

} // namespace

std::uint32_t dpi_to_ppm(const std::uint32_t dpi) {
    return static_cast<std::uint32_t>(std::lround(dpi / 0.0254));
}

std::uint32_t crc32(std::span<const std::uint8_t> data) {
    uLong crc = ::crc32(0L, Z_NULL, 0);
    // zlib takes uInt lengths
    while (!data.empty()) {
        const auto n = static_cast<uInt>(std::min<std::size_t>(data.size(), 1u << 30));
        crc = ::crc32(crc, data.data(), n);
        data = data.subspan(n);
    }
    return static_cast<std::uint32_t>(crc);
}

std::vector<std::uint8_t> inject_jfif_dpi(std::vector<std::uint8_t> jpeg, const std::uint16_t dpi) {
    if (jpeg.size() < 4 || jpeg[0] != 0xFF || jpeg[1] != 0xD8) {
        Logger::log(LogLevel::Warning, "Not a JPEG stream, JFIF patch skipped", "metadata_patcher");
        return jpeg;
    }

    if (const std::size_t at = find_jfif_app0(jpeg); at != std::string::npos) {
        // FF E0 len(2) "JFIF\0" version(2) units Xdensity(2) Ydensity(2)
        jpeg[at + 11] = 1; // dots per inch
        put_be16(&jpeg[at + 12], dpi);
        put_be16(&jpeg[at + 14], dpi);
        return jpeg;
    }

    std::array<std::uint8_t, kJfifSegmentSize> app0 = {
        0xFF, 0xE0, 0x00, 0x10, 'J', 'F', 'I', 'F', 0x00,
        0x01, 0x01,     // version 1.1
        0x01,           // units: dpi
        0, 0, 0, 0,     // densities
        0x00, 0x00      // no thumbnail
    };
    put_be16(&app0[12], dpi);
    put_be16(&app0[14], dpi);
    jpeg.insert(jpeg.begin() + 2, app0.begin(), app0.end());
    return jpeg;
}

std::vector<std::uint8_t> inject_png_phys(std::vector<std::uint8_t> png, const std::uint32_t dpi) {
    if (png.size() < kPngSignature.size() ||
        std::memcmp(png.data(), kPngSignature.data(), kPngSignature.size()) != 0) {
        Logger::log(LogLevel::Warning, "Not a PNG stream, pHYs patch skipped", "metadata_patcher");
        return png;
    }

    const std::uint32_t ppm = dpi_to_ppm(dpi);
    std::size_t ihdr_end = std::string::npos;
    std::size_t off = kPngSignature.size();

    while (off + 12 <= png.size()) {
        const std::uint32_t len = get_be32(&png[off]);
        if (len > png.size() - off - 12) {
            Logger::log(LogLevel::Warning, "Truncated PNG chunk at offset " + std::to_string(off), "metadata_patcher");
            break;
        }
        const std::uint8_t* type = &png[off + 4];

        if (std::memcmp(type, "IHDR", 4) == 0) {
            ihdr_end = off + 12 + len;
        } else if (std::memcmp(type, "pHYs", 4) == 0) {
            if (len != 9) {
                Logger::log(LogLevel::Warning, "Malformed pHYs chunk, PNG left unchanged", "metadata_patcher");
                return png;
            }
            std::uint8_t* data = &png[off + 8];
            put_be32(data, ppm);
            put_be32(data + 4, ppm);
            data[8] = 1; // metre
            put_be32(&png[off + 8 + 9], crc32(std::span<const std::uint8_t>(&png[off + 4], 4 + 9)));
            return png;
        } else if (std::memcmp(type, "IEND", 4) == 0) {
            break;
        }
        off += 12 + static_cast<std::size_t>(len);
    }

    if (ihdr_end == std::string::npos) {
        Logger::log(LogLevel::Warning, "PNG without IHDR, pHYs patch skipped", "metadata_patcher");
        return png;
    }

    std::array<std::uint8_t, kPhysChunkSize> chunk{};
    put_be32(&chunk[0], 9);
    std::memcpy(&chunk[4], "pHYs", 4);
    put_be32(&chunk[8], ppm);
    put_be32(&chunk[12], ppm);
    chunk[16] = 1;
    put_be32(&chunk[17], crc32(std::span<const std::uint8_t>(&chunk[4], 4 + 9)));
    png.insert(png.begin() + static_cast<std::ptrdiff_t>(ihdr_end), chunk.begin(), chunk.end());
    return png;
}

} // namespace scour::metadata
