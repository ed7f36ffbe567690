#include "../../include/jpeg_codec.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <cstdio>
#include <cstdlib>
#include <jpeglib.h>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

// error manager (jpeg error -> c++ exception)
struct JpegErrorMgr {
    jpeg_error_mgr pub{};
    char msg[JMSG_LENGTH_MAX]{};
};

/**
 * @brief libjpeg error handler that throws a C++ exception.
 * @param cinfo Pointer to the libjpeg error context.
 */
void jpeg_error_exit_throw(const j_common_ptr cinfo) {
    auto *err = reinterpret_cast<JpegErrorMgr *>(cinfo->err);
    (*cinfo->err->format_message)(cinfo, err->msg);
    scour::Logger::log(scour::LogLevel::Debug, std::string("libjpeg: ") + err->msg, "libjpeg");
    throw std::runtime_error(err->msg);
}

/**
 * @brief Routes libjpeg warnings (level -1) to the logger instead of stderr.
 */
void jpeg_emit_message(const j_common_ptr cinfo, const int msg_level) {
    if (msg_level >= 0) return; // trace messages
    char buffer[JMSG_LENGTH_MAX];
    (*cinfo->err->format_message)(cinfo, buffer);
    scour::Logger::log(scour::LogLevel::Warning, std::string("libjpeg: ") + buffer, "libjpeg");
}

void install_error_handlers(JpegErrorMgr& mgr, jpeg_common_struct* cinfo) {
    cinfo->err = jpeg_std_error(&mgr.pub);
    mgr.pub.error_exit = jpeg_error_exit_throw;
    mgr.pub.emit_message = jpeg_emit_message;
}

/**
 * @brief RAII owner of a decompress struct.
 */
struct JpegDecompress {
    jpeg_decompress_struct cinfo{};
    JpegErrorMgr err{};
    bool created = false;

    JpegDecompress() {
        install_error_handlers(err, reinterpret_cast<jpeg_common_struct*>(&cinfo));
        jpeg_create_decompress(&cinfo);
        created = true;
    }

    ~JpegDecompress() {
        if (created) jpeg_destroy_decompress(&cinfo);
    }

    JpegDecompress(const JpegDecompress&) = delete;
    JpegDecompress& operator=(const JpegDecompress&) = delete;
};

/**
 * @brief RAII owner of a compress struct and its memory destination buffer.
 */
struct JpegCompress {
    jpeg_compress_struct cinfo{};
    JpegErrorMgr err{};
    unsigned char* buffer = nullptr;
    unsigned long size = 0;
    bool created = false;

    JpegCompress() {
        install_error_handlers(err, reinterpret_cast<jpeg_common_struct*>(&cinfo));
        jpeg_create_compress(&cinfo);
        created = true;
    }

    ~JpegCompress() {
        if (created) jpeg_destroy_compress(&cinfo);
        std::free(buffer);
    }

    JpegCompress(const JpegCompress&) = delete;
    JpegCompress& operator=(const JpegCompress&) = delete;
};

void attach_source(jpeg_decompress_struct& cinfo, std::span<const std::uint8_t> data) {
    if (data.empty()) throw std::runtime_error("empty JPEG data");
    jpeg_mem_src(&cinfo, const_cast<unsigned char*>(data.data()), static_cast<unsigned long>(data.size()));
}

} // namespace

namespace scour {

ImageHeader JpegCodec::read_header(std::span<const std::uint8_t> data) const {
    try {
        JpegDecompress dec;
        attach_source(dec.cinfo, data);
        if (jpeg_read_header(&dec.cinfo, TRUE) != JPEG_HEADER_OK) {
            throw std::runtime_error("Invalid JPEG header");
        }
        return {static_cast<std::int64_t>(dec.cinfo.image_width),
                static_cast<std::int64_t>(dec.cinfo.image_height)};
    } catch (const std::runtime_error& e) {
        throw DecodeError(std::string("libjpeg: ") + e.what());
    }
}

DecodedImage JpegCodec::decode(std::span<const std::uint8_t> data) const {
    try {
        JpegDecompress dec;
        attach_source(dec.cinfo, data);
        if (jpeg_read_header(&dec.cinfo, TRUE) != JPEG_HEADER_OK) {
            throw std::runtime_error("Invalid JPEG header");
        }

        const bool cmyk = dec.cinfo.jpeg_color_space == JCS_CMYK || dec.cinfo.jpeg_color_space == JCS_YCCK;
        PixelLayout layout = PixelLayout::Rgb;
        if (cmyk) {
            dec.cinfo.out_color_space = JCS_CMYK;
        } else if (dec.cinfo.num_components == 1) {
            dec.cinfo.out_color_space = JCS_GRAYSCALE;
            layout = PixelLayout::Gray;
        } else {
            dec.cinfo.out_color_space = JCS_RGB;
        }

        jpeg_start_decompress(&dec.cinfo);
        const JDIMENSION width = dec.cinfo.output_width;
        const JDIMENSION height = dec.cinfo.output_height;
        const int components = dec.cinfo.output_components;

        DecodedImage image(width, height, layout);
        std::vector<JSAMPLE> cmyk_row(cmyk ? static_cast<std::size_t>(width) * components : 0);

        while (dec.cinfo.output_scanline < height) {
            const JDIMENSION y = dec.cinfo.output_scanline;
            if (!cmyk) {
                JSAMPROW row = image.row(y);
                jpeg_read_scanlines(&dec.cinfo, &row, 1);
                continue;
            }
            JSAMPROW row = cmyk_row.data();
            jpeg_read_scanlines(&dec.cinfo, &row, 1);
            // Adobe writes inverted CMYK; with inverted ink, channel * K / 255 is the RGB value
            std::uint8_t* dst = image.row(y);
            for (JDIMENSION x = 0; x < width; ++x) {
                const unsigned c = cmyk_row[x * 4 + 0];
                const unsigned m = cmyk_row[x * 4 + 1];
                const unsigned ye = cmyk_row[x * 4 + 2];
                const unsigned k = cmyk_row[x * 4 + 3];
                dst[x * 3 + 0] = static_cast<std::uint8_t>((c * k + 127) / 255);
                dst[x * 3 + 1] = static_cast<std::uint8_t>((m * k + 127) / 255);
                dst[x * 3 + 2] = static_cast<std::uint8_t>((ye * k + 127) / 255);
            }
        }

        jpeg_finish_decompress(&dec.cinfo);
        return image;
    } catch (const std::runtime_error& e) {
        throw DecodeError(std::string("libjpeg: ") + e.what());
    }
}

std::vector<std::uint8_t> JpegCodec::encode(const DecodedImage& image, const EncodeOptions& options) const {
    if (image.empty()) throw ReencodeError("JpegCodec: empty image");

    try {
        JpegCompress enc;
        jpeg_mem_dest(&enc.cinfo, &enc.buffer, &enc.size);

        const bool gray = image.layout() == PixelLayout::Gray;
        enc.cinfo.image_width = image.width();
        enc.cinfo.image_height = image.height();
        enc.cinfo.input_components = gray ? 1 : 3;
        enc.cinfo.in_color_space = gray ? JCS_GRAYSCALE : JCS_RGB;

        jpeg_set_defaults(&enc.cinfo);
        jpeg_set_quality(&enc.cinfo, options.jpeg_quality, TRUE);
        enc.cinfo.optimize_coding = TRUE;
        enc.cinfo.write_JFIF_header = TRUE;

        jpeg_start_compress(&enc.cinfo, TRUE);

        std::vector<JSAMPLE> rowbuf(static_cast<std::size_t>(image.width()) * enc.cinfo.input_components);
        while (enc.cinfo.next_scanline < enc.cinfo.image_height) {
            const std::uint32_t y = enc.cinfo.next_scanline;
            JSAMPROW row = rowbuf.data();
            if (gray || image.layout() == PixelLayout::Rgb) {
                row = const_cast<JSAMPROW>(image.row(y));
            } else {
                // alpha is expected to be flattened already; it is dropped here
                for (std::uint32_t x = 0; x < image.width(); ++x) {
                    const Rgba8 px = image.at(x, y);
                    rowbuf[x * 3 + 0] = px.r;
                    rowbuf[x * 3 + 1] = px.g;
                    rowbuf[x * 3 + 2] = px.b;
                }
            }
            jpeg_write_scanlines(&enc.cinfo, &row, 1);
        }

        jpeg_finish_compress(&enc.cinfo);
        return {enc.buffer, enc.buffer + enc.size};
    } catch (const std::runtime_error& e) {
        throw ReencodeError(std::string("libjpeg: ") + e.what());
    }
}

} // namespace scour
