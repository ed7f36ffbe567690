#include "../../include/safe_decoder.hpp"
#include "../../include/errors.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <string>

namespace scour {

SafeDecoder::SafeDecoder(const CodecRegistry& registry, const DecodeLimits limits, const std::size_t read_chunk)
    : registry_(registry), limits_(limits), read_chunk_(read_chunk) {}

void SafeDecoder::validate(const ImageHeader& header, const DecodeLimits& limits) {
    const auto dims = std::to_string(header.width) + "x" + std::to_string(header.height);
    if (header.width <= 0 || header.height <= 0) {
        throw DecodeError("invalid dimensions " + dims);
    }
    if (header.width > limits.max_image_dimension || header.height > limits.max_image_dimension) {
        throw DimensionError("monster image " + dims + " (max side " +
                             std::to_string(limits.max_image_dimension) + ")");
    }
    // both sides are at most max_image_dimension here, so the product cannot overflow int64
    if (header.width * header.height > limits.max_pixel_count) {
        throw PixelBombError("pixel bomb " + dims + " (max " +
                             std::to_string(limits.max_pixel_count) + " pixels)");
    }
}

const ICodec& SafeDecoder::decoder_for(const ImageFormat format) const {
    const ICodec* codec = registry_.find_decoder(format);
    if (!codec) {
        throw DecodeError("no decoder for " + image_format_to_string(format));
    }
    return *codec;
}

ImageHeader SafeDecoder::probe(std::span<const std::uint8_t> data, const ImageFormat format) const {
    const ImageHeader header = decoder_for(format).read_header(data);
    validate(header, limits_);
    return header;
}

DecodedImage SafeDecoder::decode(const std::filesystem::path& path, const ImageFormat format) const {
    const auto data = read_file_capped(path, limits_.max_decompressed_size, read_chunk_);
    return decode_bytes(data, format);
}

DecodedImage SafeDecoder::decode_bytes(std::span<const std::uint8_t> data, const ImageFormat format) const {
    if (data.size() > limits_.max_decompressed_size) {
        throw DecompressedSizeError("input of " + std::to_string(data.size()) + " bytes exceeds cap");
    }

    // phase 1: header only
    const ImageHeader header = probe(data, format);

    // phase 2: full decode from the start of the input
    DecodedImage image = decoder_for(format).decode(data);
    if (static_cast<std::int64_t>(image.width()) != header.width ||
        static_cast<std::int64_t>(image.height()) != header.height) {
        throw DecodeError("decoded size differs from header");
    }
    Logger::log(LogLevel::Debug,
                "Decoded " + image_format_to_string(format) + " " + std::to_string(image.width()) + "x" +
                std::to_string(image.height()) + " " + layout_to_string(image.layout()),
                "safe_decoder");
    return image;
}

} // namespace scour
