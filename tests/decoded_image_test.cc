#include "decoded_image.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <stdexcept>
#include <vector>

namespace scour {
namespace {

    TEST(DecodedImage, ZeroFilledWithLayoutStride)
    {
        const DecodedImage img(5, 3, PixelLayout::Rgb);
        EXPECT_EQ(img.channels(), 3U);
        EXPECT_EQ(img.stride(), 15U);
        EXPECT_EQ(img.pixels().size(), 45U);
        EXPECT_FALSE(img.has_alpha());
        EXPECT_EQ(img.at(4, 2), (Rgba8 { 0, 0, 0, 255 }));
    }


    TEST(DecodedImage, AdoptRejectsWrongSize)
    {
        EXPECT_THROW(DecodedImage(2, 2, PixelLayout::Rgba, std::vector<uint8_t>(15)),
                     std::invalid_argument);
        EXPECT_NO_THROW(DecodedImage(2, 2, PixelLayout::Rgba, std::vector<uint8_t>(16)));
    }


    TEST(DecodedImage, GrayStoresLuma)
    {
        DecodedImage img(1, 1, PixelLayout::Gray);
        img.set(0, 0, Rgba8 { 255, 0, 0, 255 });
        // 0.299 * 255
        EXPECT_EQ(img.row(0)[0], 76);
        EXPECT_EQ(img.at(0, 0), (Rgba8 { 76, 76, 76, 255 }));
    }


    TEST(DecodedImage, GrayAlphaKeepsAlpha)
    {
        DecodedImage img(1, 1, PixelLayout::GrayAlpha);
        img.set(0, 0, Rgba8 { 10, 10, 10, 33 });
        EXPECT_TRUE(img.has_alpha());
        EXPECT_EQ(img.at(0, 0), (Rgba8 { 10, 10, 10, 33 }));
    }


    TEST(DecodedImage, CloneIsDeep)
    {
        DecodedImage a(2, 1, PixelLayout::Rgba);
        a.set(1, 0, Rgba8 { 1, 2, 3, 4 });
        DecodedImage b = a.clone();
        b.set(1, 0, Rgba8 { 9, 9, 9, 9 });
        EXPECT_EQ(a.at(1, 0), (Rgba8 { 1, 2, 3, 4 }));
        EXPECT_EQ(b.at(1, 0), (Rgba8 { 9, 9, 9, 9 }));
    }


    TEST(DecodedImage, MoveLeavesAccessorsBound)
    {
        DecodedImage a(3, 3, PixelLayout::Gray);
        a.set(2, 2, Rgba8 { 50, 50, 50, 255 });
        DecodedImage b = std::move(a);
        EXPECT_EQ(b.at(2, 2).g, 50);
        EXPECT_STREQ(layout_to_string(b.layout()), "Gray");
    }

}  // namespace
}  // namespace scour
