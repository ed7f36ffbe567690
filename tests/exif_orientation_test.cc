#include "exif_orientation.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <vector>

namespace scour {
namespace {

    static void append_u16(std::vector<uint8_t>* out, uint16_t v, bool little)
    {
        if (little) {
            out->push_back(static_cast<uint8_t>(v));
            out->push_back(static_cast<uint8_t>(v >> 8));
        } else {
            out->push_back(static_cast<uint8_t>(v >> 8));
            out->push_back(static_cast<uint8_t>(v));
        }
    }


    static void append_u32(std::vector<uint8_t>* out, uint32_t v, bool little)
    {
        if (little) {
            append_u16(out, static_cast<uint16_t>(v), true);
            append_u16(out, static_cast<uint16_t>(v >> 16), true);
        } else {
            append_u16(out, static_cast<uint16_t>(v >> 16), false);
            append_u16(out, static_cast<uint16_t>(v), false);
        }
    }


    // TIFF header plus an IFD0 holding one Orientation entry
    static std::vector<uint8_t> tiff_with_orientation(uint16_t value, bool little,
                                                      uint16_t type = 3)
    {
        std::vector<uint8_t> t;
        t.push_back(little ? 'I' : 'M');
        t.push_back(little ? 'I' : 'M');
        append_u16(&t, 42, little);
        append_u32(&t, 8, little);
        append_u16(&t, 1, little);
        append_u16(&t, 0x0112, little);
        append_u16(&t, type, little);
        append_u32(&t, 1, little);
        append_u16(&t, value, little);
        append_u16(&t, 0, little);
        append_u32(&t, 0, little);
        return t;
    }


    static std::vector<uint8_t> jpeg_with_exif(const std::vector<uint8_t>& tiff)
    {
        const std::vector<uint8_t> base = test::make_jpeg(8, 8);
        std::vector<uint8_t> out = { 0xFF, 0xD8, 0xFF, 0xE1 };
        append_u16(&out, static_cast<uint16_t>(2 + 6 + tiff.size()), false);
        const char exif[] = { 'E', 'x', 'i', 'f', 0, 0 };
        out.insert(out.end(), exif, exif + 6);
        out.insert(out.end(), tiff.begin(), tiff.end());
        out.insert(out.end(), base.begin() + 2, base.end());
        return out;
    }


    TEST(ExifOrientation, TiffBothByteOrders)
    {
        EXPECT_EQ(read_tiff_orientation(tiff_with_orientation(6, false)), 6);
        EXPECT_EQ(read_tiff_orientation(tiff_with_orientation(8, true)), 8);
        EXPECT_EQ(read_exif_orientation(tiff_with_orientation(3, true),
                                        ImageFormat::Tiff),
                  3);
    }


    TEST(ExifOrientation, OutOfRangeOrWrongTypeIgnored)
    {
        EXPECT_FALSE(read_tiff_orientation(tiff_with_orientation(0, false)).has_value());
        EXPECT_FALSE(read_tiff_orientation(tiff_with_orientation(9, false)).has_value());
        EXPECT_FALSE(
            read_tiff_orientation(tiff_with_orientation(6, false, 4)).has_value());
    }


    TEST(ExifOrientation, TruncatedTiff)
    {
        auto t = tiff_with_orientation(6, false);
        t.resize(14);
        EXPECT_FALSE(read_tiff_orientation(t).has_value());
        EXPECT_FALSE(read_tiff_orientation(std::vector<uint8_t> { 'M', 'M' })
                         .has_value());
    }


    TEST(ExifOrientation, JpegApp1)
    {
        const auto jpeg = jpeg_with_exif(tiff_with_orientation(6, false));
        EXPECT_EQ(read_exif_orientation(jpeg, ImageFormat::Jpeg), 6);
    }


    TEST(ExifOrientation, JpegWithoutExif)
    {
        EXPECT_FALSE(read_exif_orientation(test::make_jpeg(8, 8), ImageFormat::Jpeg)
                         .has_value());
    }


    TEST(ExifOrientation, FormatsWithoutExif)
    {
        const auto tiff = tiff_with_orientation(6, false);
        EXPECT_FALSE(read_exif_orientation(tiff, ImageFormat::Gif).has_value());
        EXPECT_FALSE(read_exif_orientation(tiff, ImageFormat::Bmp).has_value());
        EXPECT_FALSE(read_exif_orientation(test::make_png(4, 4), ImageFormat::Png)
                         .has_value());
    }

}  // namespace
}  // namespace scour
