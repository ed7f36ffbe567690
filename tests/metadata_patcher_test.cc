#include "metadata_patcher.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <vector>

namespace scour {
namespace {

    // bitwise CRC-32 (reflected, poly 0xEDB88320), independent of zlib
    static uint32_t reference_crc32(std::span<const uint8_t> data)
    {
        uint32_t crc = 0xFFFFFFFFu;
        for (uint8_t b : data) {
            crc ^= b;
            for (int k = 0; k < 8; ++k) {
                crc = (crc >> 1) ^ (0xEDB88320u & (0u - (crc & 1u)));
            }
        }
        return crc ^ 0xFFFFFFFFu;
    }


    static std::vector<uint8_t> jpeg_without_app0()
    {
        // SOI, DQT stub, SOS stub, EOI: only the segment walk matters here
        return { 0xFF, 0xD8, 0xFF, 0xDB, 0x00, 0x04, 0x00, 0x00,
                 0xFF, 0xDA, 0x00, 0x02, 0x11, 0x22, 0xFF, 0xD9 };
    }


    TEST(MetadataPatcher, DpiToPpm)
    {
        EXPECT_EQ(metadata::dpi_to_ppm(96), 3780U);
        EXPECT_EQ(metadata::dpi_to_ppm(72), 2835U);
        EXPECT_EQ(metadata::dpi_to_ppm(300), 11811U);
    }


    TEST(MetadataPatcher, Crc32MatchesReference)
    {
        const std::vector<uint8_t> data = { 'I', 'E', 'N', 'D' };
        EXPECT_EQ(metadata::crc32(data), 0xAE426082U);
        const auto png = test::make_png(16, 16);
        EXPECT_EQ(metadata::crc32(png), reference_crc32(png));
    }


    TEST(MetadataPatcher, JfifExistingApp0KeepsLength)
    {
        const auto jpeg = test::make_jpeg(16, 16);
        ASSERT_TRUE(test::jfif_density(jpeg).has_value());

        const auto patched = metadata::inject_jfif_dpi(jpeg, 96);
        ASSERT_EQ(patched.size(), jpeg.size());
        const auto density = test::jfif_density(patched);
        ASSERT_TRUE(density.has_value());
        EXPECT_EQ(density->units, 1);
        EXPECT_EQ(density->x, 96);
        EXPECT_EQ(density->y, 96);
    }


    TEST(MetadataPatcher, JfifInsertedWhenMissing)
    {
        const auto jpeg    = jpeg_without_app0();
        const auto patched = metadata::inject_jfif_dpi(jpeg, 96);
        ASSERT_EQ(patched.size(), jpeg.size() + metadata::kJfifSegmentSize);
        EXPECT_EQ(patched[0], 0xFF);
        EXPECT_EQ(patched[1], 0xD8);
        EXPECT_EQ(patched[2], 0xFF);
        EXPECT_EQ(patched[3], 0xE0);

        const auto density = test::jfif_density(patched);
        ASSERT_TRUE(density.has_value());
        EXPECT_EQ(density->units, 1);
        EXPECT_EQ(density->x, 96);
        EXPECT_EQ(density->y, 96);

        // the rest of the stream is untouched
        EXPECT_TRUE(std::equal(jpeg.begin() + 2, jpeg.end(),
                               patched.begin() + 2 + metadata::kJfifSegmentSize));
    }


    TEST(MetadataPatcher, NonJpegLeftAlone)
    {
        const std::vector<uint8_t> data = { 0x00, 0x01, 0x02, 0x03 };
        EXPECT_EQ(metadata::inject_jfif_dpi(data, 96), data);
    }


    TEST(MetadataPatcher, PhysInsertedAfterIhdr)
    {
        const auto png = test::make_png(20, 10);
        ASSERT_FALSE(test::png_phys_ppu(png).has_value());

        const auto patched = metadata::inject_png_phys(png, 96);
        ASSERT_EQ(patched.size(), png.size() + metadata::kPhysChunkSize);

        const auto chunks = test::png_chunks(patched);
        ASSERT_GE(chunks.size(), 3U);
        EXPECT_EQ(chunks[0].type, "IHDR");
        EXPECT_EQ(chunks[1].type, "pHYs");
        EXPECT_EQ(chunks[1].length, 9U);

        const size_t off = chunks[1].offset;
        EXPECT_EQ(test::be32(patched, off + 8), 3780U);
        EXPECT_EQ(test::be32(patched, off + 12), 3780U);
        EXPECT_EQ(patched[off + 16], 1);

        const std::span<const uint8_t> typed(patched.data() + off + 4, 4 + 9);
        EXPECT_EQ(test::be32(patched, off + 17), reference_crc32(typed));

        int phys_count = 0;
        for (const auto& c : chunks) {
            phys_count += c.type == "pHYs" ? 1 : 0;
        }
        EXPECT_EQ(phys_count, 1);
    }


    TEST(MetadataPatcher, PhysPatchIsIdempotent)
    {
        const auto once  = metadata::inject_png_phys(test::make_png(20, 10), 96);
        const auto twice = metadata::inject_png_phys(once, 96);
        EXPECT_EQ(once, twice);
    }


    TEST(MetadataPatcher, ExistingPhysRewritten)
    {
        const auto at72 = metadata::inject_png_phys(test::make_png(8, 8), 72);
        ASSERT_EQ(test::png_phys_ppu(at72), 2835U);

        const auto at96 = metadata::inject_png_phys(at72, 96);
        EXPECT_EQ(at96.size(), at72.size());
        EXPECT_EQ(test::png_phys_ppu(at96), 3780U);

        const auto chunks = test::png_chunks(at96);
        const size_t off  = chunks[1].offset;
        const std::span<const uint8_t> typed(at96.data() + off + 4, 4 + 9);
        EXPECT_EQ(test::be32(at96, off + 17), reference_crc32(typed));
    }


    TEST(MetadataPatcher, MalformedPhysLeavesPngUnchanged)
    {
        auto png = metadata::inject_png_phys(test::make_png(8, 8), 96);
        const auto chunks = test::png_chunks(png);
        ASSERT_EQ(chunks[1].type, "pHYs");
        // declare a 10-byte pHYs by shifting the following chunk into it
        png[chunks[1].offset + 3] = 10;
        EXPECT_EQ(metadata::inject_png_phys(png, 300), png);
    }

}  // namespace
}  // namespace scour
