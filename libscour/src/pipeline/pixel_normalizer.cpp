#include "../../include/pixel_normalizer.hpp"
#include "../../include/logger.hpp"
#include "../../include/sanitization_report.hpp"
#include <algorithm>
#include <cmath>
#include <cstring>
#include <numbers>
#include <vector>

namespace scour {

namespace {

/**
 * @brief Builds a dst_w x dst_h image whose pixel (dx, dy) is src(map(dx, dy)).
 * Works on raw channel bytes, so the layout is preserved.
 */
template <typename Map>
DecodedImage remap(const DecodedImage& src, const std::uint32_t dst_w, const std::uint32_t dst_h, Map map) {
    DecodedImage dst(dst_w, dst_h, src.layout());
    const unsigned ch = src.channels();
    for (std::uint32_t dy = 0; dy < dst_h; ++dy) {
        std::uint8_t* out = dst.row(dy);
        for (std::uint32_t dx = 0; dx < dst_w; ++dx) {
            const auto [sx, sy] = map(dx, dy);
            std::memcpy(out + static_cast<std::size_t>(dx) * ch,
                        src.row(sy) + static_cast<std::size_t>(sx) * ch, ch);
        }
    }
    return dst;
}

struct Point {
    std::uint32_t x, y;
};

// --- Lanczos-3 ---

constexpr double kLanczosSupport = 3.0;

double lanczos3(const double x) {
    if (x == 0.0) return 1.0;
    if (x <= -kLanczosSupport || x >= kLanczosSupport) return 0.0;
    const double px = std::numbers::pi * x;
    return kLanczosSupport * std::sin(px) * std::sin(px / kLanczosSupport) / (px * px);
}

struct Contribution {
    std::uint32_t start = 0;
    std::vector<float> weights;
};

/**
 * @brief Normalized filter taps mapping src_len samples onto dst_len samples.
 */
std::vector<Contribution> contributions(const std::uint32_t src_len, const std::uint32_t dst_len) {
    const double scale = static_cast<double>(src_len) / dst_len;
    const double filter_scale = std::max(1.0, scale);
    const double support = kLanczosSupport * filter_scale;

    std::vector<Contribution> out(dst_len);
    for (std::uint32_t i = 0; i < dst_len; ++i) {
        const double center = (i + 0.5) * scale;
        const auto start = static_cast<std::int64_t>(std::max(0.0, std::floor(center - support)));
        const auto end = static_cast<std::int64_t>(std::min<double>(src_len, std::ceil(center + support)));

        Contribution& c = out[i];
        c.start = static_cast<std::uint32_t>(start);
        double sum = 0.0;
        for (std::int64_t j = start; j < end; ++j) {
            const double w = lanczos3((static_cast<double>(j) + 0.5 - center) / filter_scale);
            c.weights.push_back(static_cast<float>(w));
            sum += w;
        }
        if (sum != 0.0) {
            for (auto& w : c.weights) w = static_cast<float>(w / sum);
        } else {
            // degenerate window: nearest sample
            c.start = std::min<std::uint32_t>(static_cast<std::uint32_t>(center), src_len - 1);
            c.weights.assign(1, 1.0f);
        }
    }
    return out;
}

std::uint8_t clamp_to_byte(const float v) {
    return static_cast<std::uint8_t>(std::clamp(std::lround(v), 0L, 255L));
}

} // namespace

std::string PixelNormalizer::exif_rotate(DecodedImage& image, const std::optional<int> orientation) {
    switch (orientation.value_or(1)) {
        case 2: image = flip_horizontal(image); return std::string(actions::kExifFlipH);
        case 3: image = rotate180(image);       return std::string(actions::kExifRot180);
        case 4: image = flip_vertical(image);   return std::string(actions::kExifFlipV);
        case 5: image = transpose(image);       return std::string(actions::kExifTranspose);
        case 6: image = rotate270(image);       return std::string(actions::kExifRot270);
        case 7: image = transverse(image);      return std::string(actions::kExifTransverse);
        case 8: image = rotate90(image);        return std::string(actions::kExifRot90);
        default:                                return std::string(actions::kExifStripped);
    }
}

std::optional<std::string> PixelNormalizer::normalize_color_space(DecodedImage& image) {
    if (image.layout() == PixelLayout::Rgba) return std::nullopt;

    DecodedImage canvas(image.width(), image.height(), PixelLayout::Rgba);
    for (std::uint32_t y = 0; y < image.height(); ++y) {
        for (std::uint32_t x = 0; x < image.width(); ++x) {
            canvas.set(x, y, image.at(x, y));
        }
    }
    image = std::move(canvas);
    return std::string(actions::kForceSrgb);
}

std::optional<std::string> PixelNormalizer::flatten_alpha(DecodedImage& image) {
    if (!image.has_alpha()) return std::nullopt;

    const std::uint64_t area = static_cast<std::uint64_t>(image.width()) * image.height();
    const std::uint32_t step = area > kFullScanArea ? kSampleStride : 1;

    bool translucent = false;
    for (std::uint32_t y = 0; y < image.height() && !translucent; y += step) {
        for (std::uint32_t x = 0; x < image.width(); x += step) {
            if (image.at(x, y).a < 255) {
                translucent = true;
                break;
            }
        }
    }
    if (!translucent) return std::nullopt;

    // alpha-over onto opaque white
    for (std::uint32_t y = 0; y < image.height(); ++y) {
        for (std::uint32_t x = 0; x < image.width(); ++x) {
            const Rgba8 px = image.at(x, y);
            if (px.a == 255) continue;
            const unsigned a = px.a;
            const auto over = [a](const unsigned c) {
                return static_cast<std::uint8_t>((c * a + 255u * (255u - a) + 127u) / 255u);
            };
            image.set(x, y, Rgba8{over(px.r), over(px.g), over(px.b), 255});
        }
    }
    return std::string(actions::kAlphaFlatWhite);
}

std::optional<std::string> PixelNormalizer::resize_long_side(DecodedImage& image, const std::uint32_t max_long_side) {
    const std::uint32_t w = image.width();
    const std::uint32_t h = image.height();
    if (max_long_side == 0 || std::max(w, h) <= max_long_side) return std::nullopt;

    std::uint32_t new_w = 0, new_h = 0;
    if (w >= h) {
        new_w = max_long_side;
        new_h = static_cast<std::uint32_t>(std::lround(static_cast<double>(h) * max_long_side / w));
    } else {
        new_h = max_long_side;
        new_w = static_cast<std::uint32_t>(std::lround(static_cast<double>(w) * max_long_side / h));
    }
    new_w = std::max<std::uint32_t>(new_w, 1);
    new_h = std::max<std::uint32_t>(new_h, 1);

    Logger::log(LogLevel::Debug,
                "Downsampling " + std::to_string(w) + "x" + std::to_string(h) + " to " +
                std::to_string(new_w) + "x" + std::to_string(new_h),
                "pixel_normalizer");
    image = resize_lanczos3(image, new_w, new_h);
    return actions::resize(w, h, new_w, new_h);
}

DecodedImage PixelNormalizer::flip_horizontal(const DecodedImage& src) {
    const auto w = src.width();
    return remap(src, w, src.height(), [w](auto dx, auto dy) { return Point{w - 1 - dx, dy}; });
}

DecodedImage PixelNormalizer::flip_vertical(const DecodedImage& src) {
    const auto h = src.height();
    return remap(src, src.width(), h, [h](auto dx, auto dy) { return Point{dx, h - 1 - dy}; });
}

DecodedImage PixelNormalizer::rotate90(const DecodedImage& src) {
    const auto w = src.width();
    return remap(src, src.height(), w, [w](auto dx, auto dy) { return Point{w - 1 - dy, dx}; });
}

DecodedImage PixelNormalizer::rotate180(const DecodedImage& src) {
    const auto w = src.width();
    const auto h = src.height();
    return remap(src, w, h, [w, h](auto dx, auto dy) { return Point{w - 1 - dx, h - 1 - dy}; });
}

DecodedImage PixelNormalizer::rotate270(const DecodedImage& src) {
    const auto h = src.height();
    return remap(src, h, src.width(), [h](auto dx, auto dy) { return Point{dy, h - 1 - dx}; });
}

DecodedImage PixelNormalizer::transpose(const DecodedImage& src) {
    return remap(src, src.height(), src.width(), [](auto dx, auto dy) { return Point{dy, dx}; });
}

DecodedImage PixelNormalizer::transverse(const DecodedImage& src) {
    const auto w = src.width();
    const auto h = src.height();
    return remap(src, h, w, [w, h](auto dx, auto dy) { return Point{w - 1 - dy, h - 1 - dx}; });
}

DecodedImage PixelNormalizer::resize_lanczos3(const DecodedImage& src, const std::uint32_t new_width,
                                              const std::uint32_t new_height) {
    const unsigned ch = src.channels();
    const auto horizontal = contributions(src.width(), new_width);
    const auto vertical = contributions(src.height(), new_height);

    // horizontal pass into an 8-bit intermediate
    DecodedImage tmp(new_width, src.height(), src.layout());
    std::vector<float> acc(ch);
    for (std::uint32_t y = 0; y < src.height(); ++y) {
        const std::uint8_t* in = src.row(y);
        std::uint8_t* out = tmp.row(y);
        for (std::uint32_t x = 0; x < new_width; ++x) {
            const Contribution& c = horizontal[x];
            std::ranges::fill(acc, 0.0f);
            for (std::size_t k = 0; k < c.weights.size(); ++k) {
                const std::uint8_t* p = in + (static_cast<std::size_t>(c.start) + k) * ch;
                for (unsigned i = 0; i < ch; ++i) acc[i] += c.weights[k] * p[i];
            }
            for (unsigned i = 0; i < ch; ++i) out[static_cast<std::size_t>(x) * ch + i] = clamp_to_byte(acc[i]);
        }
    }

    // vertical pass
    DecodedImage dst(new_width, new_height, src.layout());
    const std::size_t stride = tmp.stride();
    std::vector<float> row_acc(stride);
    for (std::uint32_t y = 0; y < new_height; ++y) {
        const Contribution& c = vertical[y];
        std::ranges::fill(row_acc, 0.0f);
        for (std::size_t k = 0; k < c.weights.size(); ++k) {
            const std::uint8_t* in = tmp.row(c.start + static_cast<std::uint32_t>(k));
            const float w = c.weights[k];
            for (std::size_t i = 0; i < stride; ++i) row_acc[i] += w * in[i];
        }
        std::uint8_t* out = dst.row(y);
        for (std::size_t i = 0; i < stride; ++i) out[i] = clamp_to_byte(row_acc[i]);
    }
    return dst;
}

} // namespace scour
