/**
 * @file safe_decoder.hpp
 * @brief Two-phase bounded decoding.
 */

#ifndef SCOUR_SAFE_DECODER_HPP
#define SCOUR_SAFE_DECODER_HPP

#include "codec.hpp"
#include "codec_registry.hpp"
#include "decoded_image.hpp"
#include "image_format.hpp"
#include "sanitize_config.hpp"
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>

namespace scour {

    /**
     * @brief Decodes untrusted images without letting them pick the allocation size.
     *
     * @details Phase 1 parses the header only and rejects dimensions outside
     * DecodeLimits. Phase 2 decodes from the start of the input, which was read
     * through a byte cap. The pixel buffer is bounded by max_pixel_count alone.
     */
    class SafeDecoder {
    public:
        SafeDecoder(const CodecRegistry& registry, DecodeLimits limits,
                    std::size_t read_chunk = 64 * 1024);

        /**
         * @brief Read a file through the byte cap and decode it.
         * @throws DimensionError, PixelBombError, DecompressedSizeError, DecodeError
         */
        [[nodiscard]] DecodedImage decode(const std::filesystem::path& path, ImageFormat format) const;

        /**
         * @brief Decode bytes already in memory.
         * @throws DimensionError, PixelBombError, DecompressedSizeError, DecodeError
         */
        [[nodiscard]] DecodedImage decode_bytes(std::span<const std::uint8_t> data, ImageFormat format) const;

        /**
         * @brief Phase 1 only: parse the header and validate it.
         * @return The validated header.
         */
        [[nodiscard]] ImageHeader probe(std::span<const std::uint8_t> data, ImageFormat format) const;

        /**
         * @brief Check a header against the limits.
         * @throws DecodeError if a side is not positive, DimensionError if a side
         * exceeds max_image_dimension, PixelBombError if the area exceeds max_pixel_count.
         */
        static void validate(const ImageHeader& header, const DecodeLimits& limits);

        [[nodiscard]] const DecodeLimits& limits() const noexcept { return limits_; }

    private:
        [[nodiscard]] const ICodec& decoder_for(ImageFormat format) const;

        const CodecRegistry& registry_;
        DecodeLimits limits_;
        std::size_t read_chunk_;
    };

} // namespace scour

#endif // SCOUR_SAFE_DECODER_HPP
