#include "../../include/png_codec.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <png.h>
#include <zlib.h>
#include <cstring>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace scour {

namespace {

/**
 * @brief libpng error handler that throws a C++ exception.
 * @param msg The error message from libpng.
 */
void png_error_fn(png_structp, const png_const_charp msg) {
    Logger::log(LogLevel::Debug, std::string("libpng: ") + msg, "libpng");
    throw std::runtime_error(msg);
}

void png_warning_fn(png_structp, const png_const_charp msg) {
    Logger::log(LogLevel::Warning, std::string("libpng: ") + msg, "libpng");
}

/**
 * @brief RAII wrapper for libpng read structs (png_structp, png_infop).
 * Ensures png_destroy_read_struct is called even if exceptions occur.
 */
struct PngRead {
    png_structp png = nullptr;
    png_infop info = nullptr;

    explicit PngRead() = default;

    ~PngRead() {
        if (png || info) png_destroy_read_struct(&png, &info, nullptr);
    }
};

/**
 * @brief RAII wrapper for libpng write structs (png_structp, png_infop).
 */
struct PngWrite {
    png_structp png = nullptr;
    png_infop info = nullptr;

    explicit PngWrite() = default;

    ~PngWrite() {
        if (png || info) png_destroy_write_struct(&png, &info);
    }
};

struct MemoryReader {
    std::span<const std::uint8_t> data;
    std::size_t offset = 0;
};

void read_from_memory(png_structp png, png_bytep out, const png_size_t len) {
    auto* reader = static_cast<MemoryReader*>(png_get_io_ptr(png));
    if (len > reader->data.size() - reader->offset) {
        png_error(png, "unexpected end of PNG data");
    }
    std::memcpy(out, reader->data.data() + reader->offset, len);
    reader->offset += len;
}

void write_to_vector(png_structp png, png_bytep in, const png_size_t len) {
    auto* out = static_cast<std::vector<std::uint8_t>*>(png_get_io_ptr(png));
    out->insert(out->end(), in, in + len);
}

void flush_nothing(png_structp) {}

void open_reader(PngRead& rd, MemoryReader& reader) {
    if (reader.data.size() < 8 || png_sig_cmp(reader.data.data(), 0, 8) != 0) {
        throw DecodeError("libpng: bad PNG signature");
    }
    rd.png = png_create_read_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    if (!rd.png) throw DecodeError("png_create_read_struct failed");
    png_set_error_fn(rd.png, nullptr, png_error_fn, png_warning_fn);

    rd.info = png_create_info_struct(rd.png);
    if (!rd.info) throw DecodeError("png_create_info_struct failed");

    png_set_read_fn(rd.png, &reader, read_from_memory);
}

/**
 * @brief Packs RGBA color components into a single 32-bit integer.
 */
inline std::uint32_t pack_rgba(const Rgba8 px) {
    return (static_cast<std::uint32_t>(px.r) << 24) |
           (static_cast<std::uint32_t>(px.g) << 16) |
           (static_cast<std::uint32_t>(px.b) << 8)  |
           (static_cast<std::uint32_t>(px.a));
}

} // namespace

ImageHeader PngCodec::read_header(std::span<const std::uint8_t> data) const {
    MemoryReader reader{data};
    PngRead rd;
    open_reader(rd, reader);
    try {
        if (setjmp(png_jmpbuf(rd.png))) throw std::runtime_error("libpng error (header)");
        png_read_info(rd.png, rd.info);
    } catch (const std::runtime_error& e) {
        throw DecodeError(std::string("libpng: ") + e.what());
    }
    return {static_cast<std::int64_t>(png_get_image_width(rd.png, rd.info)),
            static_cast<std::int64_t>(png_get_image_height(rd.png, rd.info))};
}

DecodedImage PngCodec::decode(std::span<const std::uint8_t> data) const {
    MemoryReader reader{data};
    PngRead rd;
    open_reader(rd, reader);
    try {
        if (setjmp(png_jmpbuf(rd.png))) throw std::runtime_error("libpng error (decode)");
        png_read_info(rd.png, rd.info);

        png_uint_32 width = 0, height = 0;
        int bit_depth = 0, color_type = 0;
        png_get_IHDR(rd.png, rd.info, &width, &height, &bit_depth, &color_type, nullptr, nullptr, nullptr);
        const bool has_trns = png_get_valid(rd.png, rd.info, PNG_INFO_tRNS) != 0;

        PixelLayout layout = PixelLayout::Rgba;
        switch (color_type) {
            case PNG_COLOR_TYPE_PALETTE:
                png_set_palette_to_rgb(rd.png);
                layout = has_trns ? PixelLayout::Rgba : PixelLayout::Rgb;
                break;
            case PNG_COLOR_TYPE_GRAY:
                if (bit_depth < 8) png_set_expand_gray_1_2_4_to_8(rd.png);
                layout = has_trns ? PixelLayout::GrayAlpha : PixelLayout::Gray;
                break;
            case PNG_COLOR_TYPE_GRAY_ALPHA:
                layout = PixelLayout::GrayAlpha;
                break;
            case PNG_COLOR_TYPE_RGB:
                // truecolor is widened to the canonical layout
                if (!has_trns) png_set_filler(rd.png, 0xFF, PNG_FILLER_AFTER);
                layout = PixelLayout::Rgba;
                break;
            default:
                layout = PixelLayout::Rgba;
                break;
        }
        if (bit_depth == 16) png_set_strip_16(rd.png);
        if (has_trns) png_set_tRNS_to_alpha(rd.png);
        png_set_interlace_handling(rd.png);
        png_read_update_info(rd.png, rd.info);

        DecodedImage image(width, height, layout);
        const std::size_t rowbytes = png_get_rowbytes(rd.png, rd.info);
        if (rowbytes != image.stride()) {
            throw std::runtime_error("row size mismatch after transforms");
        }

        std::vector<png_bytep> row_pointers(height);
        for (png_uint_32 y = 0; y < height; ++y) {
            row_pointers[y] = image.row(y);
        }
        png_read_image(rd.png, row_pointers.data());
        png_read_end(rd.png, nullptr);
        return image;
    } catch (const std::runtime_error& e) {
        throw DecodeError(std::string("libpng: ") + e.what());
    }
}

std::vector<std::uint8_t> PngCodec::encode(const DecodedImage& image, const EncodeOptions&) const {
    if (image.empty()) throw ReencodeError("PngCodec: empty image");

    const std::uint32_t width = image.width();
    const std::uint32_t height = image.height();

    // analyze the pixels to pick the smallest color type
    bool all_gray = true;
    bool all_opaque = true;
    bool can_use_palette = true;
    std::unordered_map<std::uint32_t, std::uint8_t> color_to_index_map;
    std::vector<png_color> palette;
    std::vector<png_byte> transparency;

    for (std::uint32_t y = 0; y < height; ++y) {
        for (std::uint32_t x = 0; x < width; ++x) {
            const Rgba8 px = image.at(x, y);
            if (px.r != px.g || px.g != px.b) all_gray = false;
            if (px.a != 0xFF) all_opaque = false;

            if (can_use_palette) {
                const std::uint32_t color = pack_rgba(px);
                if (!color_to_index_map.contains(color)) {
                    if (color_to_index_map.size() >= 256) {
                        can_use_palette = false;
                    } else {
                        const auto index = static_cast<std::uint8_t>(color_to_index_map.size());
                        color_to_index_map[color] = index;
                        palette.push_back({px.r, px.g, px.b});
                        transparency.push_back(px.a);
                    }
                }
            }
        }
    }

    int out_color_type = 0;
    if (can_use_palette) {
        out_color_type = PNG_COLOR_TYPE_PALETTE;
    } else if (all_gray && all_opaque) {
        out_color_type = PNG_COLOR_TYPE_GRAY;
    } else if (all_gray) {
        out_color_type = PNG_COLOR_TYPE_GA;
    } else if (all_opaque) {
        out_color_type = PNG_COLOR_TYPE_RGB;
    } else {
        out_color_type = PNG_COLOR_TYPE_RGBA;
    }

    std::vector<std::uint8_t> out;
    PngWrite wr;
    wr.png = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    if (!wr.png) throw ReencodeError("png_create_write_struct failed");
    png_set_error_fn(wr.png, nullptr, png_error_fn, png_warning_fn);
    wr.info = png_create_info_struct(wr.png);
    if (!wr.info) throw ReencodeError("png_create_info_struct failed");

    try {
        if (setjmp(png_jmpbuf(wr.png))) throw std::runtime_error("libpng write error");

        png_set_write_fn(wr.png, &out, write_to_vector, flush_nothing);
        png_set_compression_level(wr.png, 9);
        png_set_compression_mem_level(wr.png, 9);
        png_set_compression_strategy(wr.png, Z_DEFAULT_STRATEGY);
        png_set_filter(wr.png, PNG_FILTER_TYPE_BASE, PNG_ALL_FILTERS);

        png_set_IHDR(wr.png, wr.info, width, height, 8, out_color_type,
                     PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_BASE, PNG_FILTER_TYPE_BASE);

        if (out_color_type == PNG_COLOR_TYPE_PALETTE) {
            png_set_PLTE(wr.png, wr.info, palette.data(), static_cast<int>(palette.size()));
            // only write tRNS if there is actual transparency
            if (!all_opaque) {
                png_set_tRNS(wr.png, wr.info, transparency.data(), static_cast<int>(transparency.size()), nullptr);
            }
        }

        png_write_info(wr.png, wr.info);

        const png_size_t out_channels = png_get_channels(wr.png, wr.info);
        std::vector<std::uint8_t> out_rowbuf(static_cast<std::size_t>(width) * out_channels);
        png_bytep out_row = out_rowbuf.data();

        for (std::uint32_t y = 0; y < height; ++y) {
            std::uint8_t* dst = out_row;
            for (std::uint32_t x = 0; x < width; ++x) {
                const Rgba8 px = image.at(x, y);
                switch (out_color_type) {
                    case PNG_COLOR_TYPE_PALETTE:
                        *dst++ = color_to_index_map.at(pack_rgba(px));
                        break;
                    case PNG_COLOR_TYPE_GRAY:
                        *dst++ = px.r;
                        break;
                    case PNG_COLOR_TYPE_GA:
                        *dst++ = px.r;
                        *dst++ = px.a;
                        break;
                    case PNG_COLOR_TYPE_RGB:
                        *dst++ = px.r;
                        *dst++ = px.g;
                        *dst++ = px.b;
                        break;
                    default:
                        *dst++ = px.r;
                        *dst++ = px.g;
                        *dst++ = px.b;
                        *dst++ = px.a;
                        break;
                }
            }
            png_write_rows(wr.png, &out_row, 1);
        }

        png_write_end(wr.png, wr.info);
    } catch (const std::runtime_error& e) {
        throw ReencodeError(std::string("libpng: ") + e.what());
    }
    return out;
}

} // namespace scour
