/**
 * @file codec_registry.hpp
 * @brief Owns the codec backends and looks them up by format.
 */

#ifndef SCOUR_CODEC_REGISTRY_HPP
#define SCOUR_CODEC_REGISTRY_HPP

#include "codec.hpp"
#include <memory>
#include <vector>

namespace scour {

/**
 * @brief Registry of all available codecs.
 *
 * @details Instantiated once per job and shared read-only by the workers.
 */
class CodecRegistry {
public:
    /**
     * @brief Construct and register the built-in codecs
     * (libpng, libjpeg, libwebp, libtiff, stb_image for GIF/BMP).
     */
    CodecRegistry();

    /**
     * @brief Codec that decodes a format.
     * @return Non-owning pointer, nullptr if none is registered.
     */
    [[nodiscard]] const ICodec* find_decoder(ImageFormat format) const;

    /**
     * @brief Codec that can encode a format.
     * @return Non-owning pointer, nullptr if no registered codec encodes it.
     */
    [[nodiscard]] const ICodec* find_encoder(ImageFormat format) const;


private:
    std::vector<std::unique_ptr<ICodec>> codecs_;
};

} // namespace scour

#endif // SCOUR_CODEC_REGISTRY_HPP
