#include "safe_decoder.hpp"

#include "codec_registry.hpp"
#include "errors.hpp"
#include "exif_orientation.hpp"
#include "metadata_patcher.hpp"
#include "pixel_normalizer.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <webp/encode.h>

#include <cstdint>
#include <string_view>
#include <vector>

namespace scour {
namespace {

    static void append_u32be(std::vector<uint8_t>* out, uint32_t v)
    {
        out->push_back(static_cast<uint8_t>((v >> 24) & 0xFF));
        out->push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
        out->push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
        out->push_back(static_cast<uint8_t>((v >> 0) & 0xFF));
    }


    static void append_png_chunk(std::vector<uint8_t>* out, std::string_view type,
                                 const std::vector<uint8_t>& data)
    {
        append_u32be(out, static_cast<uint32_t>(data.size()));
        std::vector<uint8_t> typed(type.begin(), type.end());
        typed.insert(typed.end(), data.begin(), data.end());
        out->insert(out->end(), typed.begin(), typed.end());
        append_u32be(out, metadata::crc32(typed));
    }


    // signature, IHDR claiming w x h, a token IDAT and IEND
    static std::vector<uint8_t> png_claiming(uint32_t w, uint32_t h)
    {
        std::vector<uint8_t> png = { 0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A };
        std::vector<uint8_t> ihdr;
        append_u32be(&ihdr, w);
        append_u32be(&ihdr, h);
        ihdr.push_back(8);  // bit depth
        ihdr.push_back(6);  // RGBA
        ihdr.push_back(0);
        ihdr.push_back(0);
        ihdr.push_back(0);
        append_png_chunk(&png, "IHDR", ihdr);
        append_png_chunk(&png, "IDAT", { 0x78, 0x9C, 0x03, 0x00, 0x00, 0x00, 0x00, 0x01 });
        append_png_chunk(&png, "IEND", {});
        return png;
    }


    static void append_u16le(std::vector<uint8_t>* out, uint16_t v)
    {
        out->push_back(static_cast<uint8_t>(v & 0xFF));
        out->push_back(static_cast<uint8_t>(v >> 8));
    }


    static void append_u32le(std::vector<uint8_t>* out, uint32_t v)
    {
        append_u16le(out, static_cast<uint16_t>(v & 0xFFFF));
        append_u16le(out, static_cast<uint16_t>(v >> 16));
    }


    static void expect_rgb(const DecodedImage& img, uint32_t x, uint32_t y, uint8_t r,
                           uint8_t g, uint8_t b)
    {
        const Rgba8 px = img.at(x, y);
        EXPECT_EQ(px.r, r) << "at " << x << "," << y;
        EXPECT_EQ(px.g, g) << "at " << x << "," << y;
        EXPECT_EQ(px.b, b) << "at " << x << "," << y;
        EXPECT_EQ(px.a, 255) << "at " << x << "," << y;
    }


    // 2x2 GIF89a: red, green / blue, white through a 4-entry global palette.
    // LZW stream: clear, 0, 1, 2 in 3-bit codes, then 3 and end in 4-bit codes.
    static std::vector<uint8_t> gif_2x2()
    {
        return {
            'G',  'I',  'F',  '8',  '9',  'a',  0x02, 0x00, 0x02, 0x00, 0xF1, 0x00, 0x00,
            0xFF, 0x00, 0x00, 0x00, 0xFF, 0x00, 0x00, 0x00, 0xFF, 0xFF, 0xFF, 0xFF,
            0x2C, 0x00, 0x00, 0x00, 0x00, 0x02, 0x00, 0x02, 0x00, 0x00,
            0x02, 0x03, 0x44, 0x34, 0x05, 0x00,
            0x3B,
        };
    }


    // 2x2 24-bit BMP with the same colors, rows stored bottom-up and padded to 4 bytes
    static std::vector<uint8_t> bmp_2x2()
    {
        std::vector<uint8_t> bmp = { 'B', 'M' };
        append_u32le(&bmp, 54 + 16);
        append_u32le(&bmp, 0);
        append_u32le(&bmp, 54);
        append_u32le(&bmp, 40);
        append_u32le(&bmp, 2);
        append_u32le(&bmp, 2);
        append_u16le(&bmp, 1);
        append_u16le(&bmp, 24);
        append_u32le(&bmp, 0);
        append_u32le(&bmp, 16);
        append_u32le(&bmp, 2835);
        append_u32le(&bmp, 2835);
        append_u32le(&bmp, 0);
        append_u32le(&bmp, 0);
        const std::vector<uint8_t> rows = {
            0xFF, 0x00, 0x00, 0xFF, 0xFF, 0xFF, 0x00, 0x00,  // blue, white
            0x00, 0x00, 0xFF, 0x00, 0xFF, 0x00, 0x00, 0x00,  // red, green
        };
        bmp.insert(bmp.end(), rows.begin(), rows.end());
        return bmp;
    }


    // 3x2 RGB image whose red channel numbers the pixels 10..60 in row order
    static DecodedImage numbered_rgb()
    {
        DecodedImage img(3, 2, PixelLayout::Rgb);
        for (uint32_t y = 0; y < 2; ++y) {
            for (uint32_t x = 0; x < 3; ++x) {
                const auto v = static_cast<uint8_t>(10 * (y * 3 + x + 1));
                img.set(x, y, Rgba8 { v, 7, static_cast<uint8_t>(255 - v), 255 });
            }
        }
        return img;
    }


    static void validate_default(int64_t w, int64_t h)
    {
        SafeDecoder::validate(ImageHeader { w, h }, DecodeLimits {});
    }


    TEST(SafeDecoder, ValidateBounds)
    {
        EXPECT_NO_THROW(validate_default(2500, 2500));
        EXPECT_NO_THROW(validate_default(50000, 10000));
        EXPECT_THROW(validate_default(0, 10), DecodeError);
        EXPECT_THROW(validate_default(10, -1), DecodeError);
        EXPECT_THROW(validate_default(50001, 1), DimensionError);
        EXPECT_THROW(validate_default(1, 60000), DimensionError);
        EXPECT_THROW(validate_default(40000, 40000), PixelBombError);
    }


    TEST(SafeDecoder, MonsterHeaderRejectedBeforeDecode)
    {
        const CodecRegistry registry;
        const SafeDecoder decoder(registry, DecodeLimits {});

        const auto monster = png_claiming(60000, 60000);
        EXPECT_THROW((void)decoder.decode_bytes(monster, ImageFormat::Png), DimensionError);

        const auto bomb = png_claiming(40000, 40000);
        EXPECT_THROW((void)decoder.decode_bytes(bomb, ImageFormat::Png), PixelBombError);
    }


    TEST(SafeDecoder, ProbeReadsHeaderOnly)
    {
        const CodecRegistry registry;
        const SafeDecoder decoder(registry, DecodeLimits {});

        // the IDAT here could never produce 300x200 pixels
        const ImageHeader header = decoder.probe(png_claiming(300, 200), ImageFormat::Png);
        EXPECT_EQ(header.width, 300);
        EXPECT_EQ(header.height, 200);
    }


    TEST(SafeDecoder, ByteCapApplies)
    {
        const CodecRegistry registry;
        DecodeLimits limits;
        limits.max_decompressed_size = 8 * 1024;
        const SafeDecoder decoder(registry, limits);

        const std::vector<uint8_t> big(16 * 1024, 0xAB);
        EXPECT_THROW((void)decoder.decode_bytes(big, ImageFormat::Png), DecompressedSizeError);

        test::TempDir dir;
        test::write_all(dir / "big.png", big);
        EXPECT_THROW((void)decoder.decode(dir / "big.png", ImageFormat::Png),
                     DecompressedSizeError);
    }


    TEST(SafeDecoder, ByteCapDoesNotBoundPixelBuffer)
    {
        const CodecRegistry registry;

        // 200M pixels is under max_pixel_count and passes phase 1
        const SafeDecoder defaults(registry, DecodeLimits {});
        const ImageHeader large = defaults.probe(png_claiming(20000, 10000), ImageFormat::Png);
        EXPECT_EQ(large.width, 20000);
        EXPECT_EQ(large.height, 10000);

        DecodeLimits limits;
        limits.max_decompressed_size = 14 * 1024;
        const SafeDecoder decoder(registry, limits);

        // 64 x 64 RGBA needs 16 KiB, more than the cap, from a much smaller input
        const auto png = test::make_png(64, 64);
        ASSERT_LT(png.size(), limits.max_decompressed_size);
        const DecodedImage img = decoder.decode_bytes(png, ImageFormat::Png);
        EXPECT_EQ(img.width(), 64U);
        EXPECT_EQ(img.height(), 64U);

        // a header whose buffer exceeds the cap reaches phase 2 and fails there
        const auto bogus = png_claiming(200, 100);
        try {
            (void)decoder.decode_bytes(bogus, ImageFormat::Png);
            FAIL() << "token IDAT decoded as 200x100";
        } catch (const DecompressedSizeError& e) {
            FAIL() << "rejected before phase 2: " << e.what();
        } catch (const DecodeError&) {
        }
    }


    TEST(SafeDecoder, DecodesPngAndJpeg)
    {
        const CodecRegistry registry;
        const SafeDecoder decoder(registry, DecodeLimits {});

        const DecodedImage png = decoder.decode_bytes(test::make_png(100, 50), ImageFormat::Png);
        EXPECT_EQ(png.width(), 100U);
        EXPECT_EQ(png.height(), 50U);
        // truecolor PNGs come back in the canonical layout, opaque
        EXPECT_EQ(png.layout(), PixelLayout::Rgba);
        EXPECT_EQ(png.at(99, 49).a, 255);

        const DecodedImage translucent
            = decoder.decode_bytes(test::make_png(100, 50, PixelLayout::Rgba, 128),
                                   ImageFormat::Png);
        EXPECT_TRUE(translucent.has_alpha());
        EXPECT_EQ(translucent.at(10, 10).a, 128);

        const DecodedImage jpeg = decoder.decode_bytes(test::make_jpeg(40, 30), ImageFormat::Jpeg);
        EXPECT_EQ(jpeg.width(), 40U);
        EXPECT_EQ(jpeg.height(), 30U);
        EXPECT_EQ(jpeg.layout(), PixelLayout::Rgb);
    }


    TEST(SafeDecoder, DecodesGifAndBmp)
    {
        const CodecRegistry registry;
        const SafeDecoder decoder(registry, DecodeLimits {});

        const DecodedImage gif = decoder.decode_bytes(gif_2x2(), ImageFormat::Gif);
        ASSERT_EQ(gif.width(), 2U);
        ASSERT_EQ(gif.height(), 2U);
        expect_rgb(gif, 0, 0, 255, 0, 0);
        expect_rgb(gif, 1, 0, 0, 255, 0);
        expect_rgb(gif, 0, 1, 0, 0, 255);
        expect_rgb(gif, 1, 1, 255, 255, 255);

        const DecodedImage bmp = decoder.decode_bytes(bmp_2x2(), ImageFormat::Bmp);
        ASSERT_EQ(bmp.width(), 2U);
        ASSERT_EQ(bmp.height(), 2U);
        EXPECT_EQ(bmp.layout(), PixelLayout::Rgb);
        expect_rgb(bmp, 0, 0, 255, 0, 0);
        expect_rgb(bmp, 1, 0, 0, 255, 0);
        expect_rgb(bmp, 0, 1, 0, 0, 255);
        expect_rgb(bmp, 1, 1, 255, 255, 255);
    }


    TEST(SafeDecoder, DecodesTiff)
    {
        const CodecRegistry registry;
        const SafeDecoder decoder(registry, DecodeLimits {});
        test::TempDir dir;

        const DecodedImage src = numbered_rgb();
        ASSERT_TRUE(test::write_tiff(dir / "plain.tif", src));
        const DecodedImage tiff
            = decoder.decode_bytes(test::read_all(dir / "plain.tif"), ImageFormat::Tiff);
        ASSERT_EQ(tiff.width(), 3U);
        ASSERT_EQ(tiff.height(), 2U);
        for (uint32_t y = 0; y < 2; ++y) {
            for (uint32_t x = 0; x < 3; ++x) {
                const Rgba8 px = src.at(x, y);
                expect_rgb(tiff, x, y, px.r, px.g, px.b);
            }
        }
    }


    TEST(SafeDecoder, TiffOrientationAppliedOnce)
    {
        const CodecRegistry registry;
        const SafeDecoder decoder(registry, DecodeLimits {});
        test::TempDir dir;

        ASSERT_TRUE(test::write_tiff(dir / "rot.tif", numbered_rgb(), ORIENTATION_RIGHTTOP));
        const auto bytes = test::read_all(dir / "rot.tif");
        ASSERT_EQ(read_exif_orientation(bytes, ImageFormat::Tiff), 6);

        // the decoder hands back rows in stored order
        DecodedImage img = decoder.decode_bytes(bytes, ImageFormat::Tiff);
        ASSERT_EQ(img.width(), 3U);
        ASSERT_EQ(img.height(), 2U);
        EXPECT_EQ(img.at(0, 0).r, 10);
        EXPECT_EQ(img.at(2, 1).r, 60);

        // and the tag turns it a quarter clockwise
        (void)PixelNormalizer::exif_rotate(img, read_exif_orientation(bytes, ImageFormat::Tiff));
        ASSERT_EQ(img.width(), 2U);
        ASSERT_EQ(img.height(), 3U);
        EXPECT_EQ(img.at(0, 0).r, 40);
        EXPECT_EQ(img.at(1, 0).r, 10);
        EXPECT_EQ(img.at(0, 2).r, 60);
        EXPECT_EQ(img.at(1, 2).r, 30);
    }


    TEST(SafeDecoder, DecodesLosslessWebp)
    {
        const CodecRegistry registry;
        const SafeDecoder decoder(registry, DecodeLimits {});

        const DecodedImage src = test::gradient(16, 8, PixelLayout::Rgb);
        uint8_t* out = nullptr;
        const size_t size = WebPEncodeLosslessRGB(src.pixels().data(), 16, 8,
                                                  static_cast<int>(src.stride()), &out);
        ASSERT_GT(size, 0U);
        const std::vector<uint8_t> webp(out, out + size);
        WebPFree(out);

        const ImageHeader header = decoder.probe(webp, ImageFormat::Webp);
        EXPECT_EQ(header.width, 16);
        EXPECT_EQ(header.height, 8);

        const DecodedImage img = decoder.decode_bytes(webp, ImageFormat::Webp);
        ASSERT_EQ(img.width(), 16U);
        ASSERT_EQ(img.height(), 8U);
        for (uint32_t y = 0; y < 8; ++y) {
            for (uint32_t x = 0; x < 16; ++x) {
                const Rgba8 px = src.at(x, y);
                expect_rgb(img, x, y, px.r, px.g, px.b);
            }
        }
    }


    TEST(SafeDecoder, CorruptDataIsDecodeError)
    {
        const CodecRegistry registry;
        const SafeDecoder decoder(registry, DecodeLimits {});

        auto png = test::make_png(32, 32);
        png.resize(png.size() / 2);
        EXPECT_THROW((void)decoder.decode_bytes(png, ImageFormat::Png), DecodeError);

        const std::vector<uint8_t> jpeg = { 0xFF, 0xD8, 0xFF, 0xE0, 0x00, 0x02, 0xFF, 0xD9 };
        EXPECT_THROW((void)decoder.decode_bytes(jpeg, ImageFormat::Jpeg), DecodeError);
    }

}  // namespace
}  // namespace scour
