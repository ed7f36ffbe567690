#include "../../include/codec_registry.hpp"
#include "../../include/jpeg_codec.hpp"
#include "../../include/png_codec.hpp"
#include "../../include/stb_codec.hpp"
#include "../../include/tiff_codec.hpp"
#include "../../include/webp_codec.hpp"
#include <algorithm>

namespace scour {

CodecRegistry::CodecRegistry() {
    codecs_.push_back(std::make_unique<JpegCodec>());
    codecs_.push_back(std::make_unique<PngCodec>());
    codecs_.push_back(std::make_unique<WebpCodec>());
    codecs_.push_back(std::make_unique<TiffCodec>());
    codecs_.push_back(std::make_unique<StbCodec>());
}

const ICodec* CodecRegistry::find_decoder(const ImageFormat format) const {
    for (const auto& codec : codecs_) {
        const auto formats = codec->get_supported_formats();
        if (std::ranges::find(formats, format) != formats.end()) {
            return codec.get();
        }
    }
    return nullptr;
}

const ICodec* CodecRegistry::find_encoder(const ImageFormat format) const {
    for (const auto& codec : codecs_) {
        if (!codec->can_encode()) continue;
        const auto formats = codec->get_supported_formats();
        if (std::ranges::find(formats, format) != formats.end()) {
            return codec.get();
        }
    }
    return nullptr;
}

} // namespace scour
