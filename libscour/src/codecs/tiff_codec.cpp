#include "../../include/tiff_codec.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <tiffio.h>
#include <algorithm>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace scour {

namespace {

void tiff_message(const LogLevel level, const char* module, const char* fmt, va_list ap) {
    char buffer[512];
    std::vsnprintf(buffer, sizeof(buffer), fmt, ap);
    std::string msg = "libtiff: ";
    if (module) msg += std::string(module) + ": ";
    Logger::log(level, msg + buffer, "libtiff");
}

void tiff_error_handler(const char* module, const char* fmt, va_list ap) {
    tiff_message(LogLevel::Debug, module, fmt, ap);
}

void tiff_warning_handler(const char* module, const char* fmt, va_list ap) {
    tiff_message(LogLevel::Debug, module, fmt, ap);
}

/**
 * @brief Route libtiff's global diagnostics to the logger, once per process.
 */
void install_tiff_handlers() {
    static std::once_flag once;
    std::call_once(once, [] {
        TIFFSetErrorHandler(tiff_error_handler);
        TIFFSetWarningHandler(tiff_warning_handler);
    });
}

// --- read-only memory stream for TIFFClientOpen ---

struct MemoryStream {
    std::span<const std::uint8_t> data;
    toff_t offset = 0;
};

tmsize_t mem_read(thandle_t h, void* buf, tmsize_t size) {
    auto* s = static_cast<MemoryStream*>(h);
    if (size <= 0 || s->offset >= s->data.size()) return 0;
    const auto n = std::min<toff_t>(static_cast<toff_t>(size), s->data.size() - s->offset);
    std::memcpy(buf, s->data.data() + s->offset, n);
    s->offset += n;
    return static_cast<tmsize_t>(n);
}

tmsize_t mem_write(thandle_t, void*, tmsize_t) {
    return 0;
}

toff_t mem_seek(thandle_t h, const toff_t off, const int whence) {
    auto* s = static_cast<MemoryStream*>(h);
    toff_t base = 0;
    switch (whence) {
        case SEEK_SET: base = 0; break;
        case SEEK_CUR: base = s->offset; break;
        case SEEK_END: base = s->data.size(); break;
        default: return static_cast<toff_t>(-1);
    }
    s->offset = base + off;
    return s->offset;
}

int mem_close(thandle_t) {
    return 0;
}

toff_t mem_size(thandle_t h) {
    return static_cast<MemoryStream*>(h)->data.size();
}

int mem_map(thandle_t, void**, toff_t*) {
    return 0;
}

void mem_unmap(thandle_t, void*, toff_t) {}

struct TiffCloser {
    void operator()(TIFF* t) const { if (t) TIFFClose(t); }
};
using unique_TIFF = std::unique_ptr<TIFF, TiffCloser>;

unique_TIFF open_memory(MemoryStream& stream) {
    install_tiff_handlers();
    unique_TIFF tif(TIFFClientOpen("memory", "rm", &stream,
                                   mem_read, mem_write, mem_seek, mem_close,
                                   mem_size, mem_map, mem_unmap));
    if (!tif) throw DecodeError("libtiff: cannot open TIFF stream");
    return tif;
}

} // namespace

ImageHeader TiffCodec::read_header(std::span<const std::uint8_t> data) const {
    MemoryStream stream{data};
    const auto tif = open_memory(stream);
    std::uint32_t width = 0, height = 0;
    if (!TIFFGetField(tif.get(), TIFFTAG_IMAGEWIDTH, &width) ||
        !TIFFGetField(tif.get(), TIFFTAG_IMAGELENGTH, &height)) {
        throw DecodeError("libtiff: missing image dimensions");
    }
    return {width, height};
}

DecodedImage TiffCodec::decode(std::span<const std::uint8_t> data) const {
    MemoryStream stream{data};
    const auto tif = open_memory(stream);

    std::uint32_t width = 0, height = 0;
    TIFFGetField(tif.get(), TIFFTAG_IMAGEWIDTH, &width);
    TIFFGetField(tif.get(), TIFFTAG_IMAGELENGTH, &height);
    if (width == 0 || height == 0) throw DecodeError("libtiff: empty TIFF directory");

    // request the file's own orientation so rows come back in stored order;
    // the orientation tag is applied later, like for every other format
    std::uint16_t orientation = ORIENTATION_TOPLEFT;
    TIFFGetFieldDefaulted(tif.get(), TIFFTAG_ORIENTATION, &orientation);

    std::vector<std::uint32_t> raster(static_cast<std::size_t>(width) * height);
    if (!TIFFReadRGBAImageOriented(tif.get(), width, height, raster.data(), orientation, 0)) {
        throw DecodeError("libtiff: TIFFReadRGBAImageOriented failed");
    }

    DecodedImage image(width, height, PixelLayout::Rgba);
    for (std::uint32_t y = 0; y < height; ++y) {
        const std::uint32_t* src = raster.data() + static_cast<std::size_t>(y) * width;
        std::uint8_t* dst = image.row(y);
        for (std::uint32_t x = 0; x < width; ++x) {
            const std::uint32_t abgr = src[x];
            *dst++ = static_cast<std::uint8_t>(TIFFGetR(abgr));
            *dst++ = static_cast<std::uint8_t>(TIFFGetG(abgr));
            *dst++ = static_cast<std::uint8_t>(TIFFGetB(abgr));
            *dst++ = static_cast<std::uint8_t>(TIFFGetA(abgr));
        }
    }
    return image;
}

std::vector<std::uint8_t> TiffCodec::encode(const DecodedImage&, const EncodeOptions&) const {
    throw ReencodeError("TiffCodec does not encode");
}

} // namespace scour
