#include "container_codec.hpp"
#include "errors.hpp"

#include "test_support.hpp"
#include "zip_fixture.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <vector>

namespace scour {
namespace {

    namespace fs = std::filesystem;

    static std::string read_text(const fs::path& p)
    {
        const auto bytes = test::read_all(p);
        return std::string(bytes.begin(), bytes.end());
    }


    static std::vector<std::string> names_of(const std::vector<test::ZipEntry>& entries)
    {
        std::vector<std::string> out;
        for (const auto& e : entries) {
            out.push_back(e.name);
        }
        return out;
    }


    TEST(ContainerCodec, ResolveInsideRoot)
    {
        const fs::path root = "/tmp/ws";
        EXPECT_EQ(ContainerCodec::resolve_entry_path("OEBPS/a.png", root),
                  fs::path("/tmp/ws/OEBPS/a.png"));
        EXPECT_EQ(ContainerCodec::resolve_entry_path("./mimetype", root),
                  fs::path("/tmp/ws/mimetype"));
        EXPECT_EQ(ContainerCodec::resolve_entry_path("sub\\file.txt", root),
                  fs::path("/tmp/ws/sub/file.txt"));
        EXPECT_EQ(ContainerCodec::resolve_entry_path("a/../b.txt", root),
                  fs::path("/tmp/ws/b.txt"));
    }


    TEST(ContainerCodec, ResolveRejectsEscapes)
    {
        const fs::path root = "/tmp/ws";
        EXPECT_FALSE(ContainerCodec::resolve_entry_path("", root).has_value());
        EXPECT_FALSE(ContainerCodec::resolve_entry_path("../x", root).has_value());
        EXPECT_FALSE(ContainerCodec::resolve_entry_path("../../evil.txt", root).has_value());
        EXPECT_FALSE(ContainerCodec::resolve_entry_path("a/../../x", root).has_value());
        EXPECT_FALSE(ContainerCodec::resolve_entry_path("..\\..\\x", root).has_value());
        EXPECT_FALSE(ContainerCodec::resolve_entry_path("/etc/passwd", root).has_value());
        EXPECT_FALSE(ContainerCodec::resolve_entry_path("../ws2/x", root).has_value());
        EXPECT_FALSE(ContainerCodec::resolve_entry_path("a/..", root).has_value());
        EXPECT_FALSE(ContainerCodec::resolve_entry_path(std::string_view("a\0b", 3), root)
                         .has_value());
    }


    TEST(ContainerCodec, TrimMimetype)
    {
        EXPECT_EQ(ContainerCodec::trim_mimetype("application/epub+zip\r\n"),
                  "application/epub+zip");
        EXPECT_EQ(ContainerCodec::trim_mimetype("application/epub+zip"),
                  "application/epub+zip");
        EXPECT_EQ(ContainerCodec::trim_mimetype(" \n"), "");
    }


    TEST(ContainerCodec, UnzipSkipsTraversal)
    {
        test::TempDir dir;
        const fs::path archive = dir / "in.epub";
        test::write_zip(archive, {
                                     { "mimetype", "application/epub+zip" },
                                     { "OEBPS/content.opf", "<package/>" },
                                     { "../../evil.txt", "pwned" },
                                     { "OEBPS/images/a.png", "png bytes" },
                                 });

        const fs::path dest = dir / "out";
        const UnzipResult result = ContainerCodec().unzip(archive, dest);

        EXPECT_EQ(result.extracted, 3U);
        ASSERT_EQ(result.skipped.size(), 1U);
        EXPECT_EQ(result.skipped[0].name, "../../evil.txt");
        EXPECT_EQ(result.skipped[0].reason, "path escapes destination");

        EXPECT_EQ(read_text(dest / "mimetype"), "application/epub+zip");
        EXPECT_EQ(read_text(dest / "OEBPS/images/a.png"), "png bytes");
        EXPECT_FALSE(fs::exists(dir / "evil.txt"));
        EXPECT_FALSE(fs::exists(dir.path().parent_path() / "evil.txt"));
    }


    TEST(ContainerCodec, UnzipSkipsSymlinks)
    {
        test::TempDir dir;
        const fs::path archive = dir / "in.epub";
        test::write_zip(archive, {
                                     { "mimetype", "application/epub+zip" },
                                     { "OEBPS/link", "/etc/passwd", true },
                                 });

        const fs::path dest = dir / "out";
        const UnzipResult result = ContainerCodec().unzip(archive, dest);
        EXPECT_EQ(result.extracted, 1U);
        ASSERT_EQ(result.skipped.size(), 1U);
        EXPECT_EQ(result.skipped[0].reason, "not a regular file");
        EXPECT_FALSE(fs::exists(fs::symlink_status(dest / "OEBPS/link")));
    }


    TEST(ContainerCodec, UnzipRejectsGarbage)
    {
        test::TempDir dir;
        const fs::path bogus = dir / "bogus.epub";
        test::write_text(bogus, "definitely not an archive\x01\x02\x03");
        EXPECT_THROW((void)ContainerCodec().unzip(bogus, dir / "out"), ArchiveError);
        EXPECT_THROW((void)ContainerCodec().unzip(dir / "missing.epub", dir / "out"),
                     ArchiveError);
    }


    TEST(ContainerCodec, ZipStrictWritesStoredMimetypeFirst)
    {
        test::TempDir dir;
        const fs::path src = dir / "src";
        test::write_text(src / "mimetype", "application/epub+zip\n");
        test::write_text(src / "OEBPS/z.xhtml", "<html/>");
        test::write_text(src / "META-INF/container.xml", "<container/>");
        test::write_text(src / "OEBPS/images/b.png", "b");
        test::write_text(src / "OEBPS/images/a.png", "a");

        const fs::path out = dir / "out/book.epub";
        EXPECT_EQ(ContainerCodec().zip_strict(src, out), 5U);

        const auto bytes = test::read_all(out);
        ASSERT_GT(bytes.size(), 38U);
        EXPECT_EQ(bytes[0], 'P');
        EXPECT_EQ(bytes[1], 'K');
        EXPECT_EQ(bytes[2], 3);
        EXPECT_EQ(bytes[3], 4);
        // compression method: stored
        EXPECT_EQ(bytes[8], 0);
        EXPECT_EQ(bytes[9], 0);
        EXPECT_EQ(std::string(bytes.begin() + 30, bytes.begin() + 38), "mimetype");

        const auto entries = test::read_zip(out);
        EXPECT_EQ(names_of(entries),
                  (std::vector<std::string> { "mimetype", "META-INF/container.xml",
                                              "OEBPS/images/a.png", "OEBPS/images/b.png",
                                              "OEBPS/z.xhtml" }));
        EXPECT_EQ(entries[0].content, "application/epub+zip");
        EXPECT_EQ(entries[4].content, "<html/>");
    }


    TEST(ContainerCodec, ZipStrictDefaultsMimetype)
    {
        test::TempDir dir;
        test::write_text(dir / "src/OEBPS/a.xhtml", "x");
        const fs::path out = dir / "book.epub";
        EXPECT_EQ(ContainerCodec().zip_strict(dir / "src", out), 2U);

        const auto entries = test::read_zip(out);
        ASSERT_EQ(entries.size(), 2U);
        EXPECT_EQ(entries[0].name, "mimetype");
        EXPECT_EQ(entries[0].content, ContainerCodec::kDefaultMimetype);
    }


    TEST(ContainerCodec, NestedMimetypeIsOrdinaryEntry)
    {
        test::TempDir dir;
        test::write_text(dir / "src/mimetype", "application/epub+zip");
        test::write_text(dir / "src/extra/mimetype", "other");
        const fs::path out = dir / "book.epub";
        EXPECT_EQ(ContainerCodec().zip_strict(dir / "src", out), 2U);
        EXPECT_EQ(names_of(test::read_zip(out)),
                  (std::vector<std::string> { "mimetype", "extra/mimetype" }));
    }


    TEST(ContainerCodec, ZipStrictFailureLeavesNoOutput)
    {
        test::TempDir dir;
        EXPECT_THROW(ContainerCodec().zip_strict(dir / "nope", dir / "x.epub"), ArchiveError);
        EXPECT_FALSE(fs::exists(dir / "x.epub"));

        test::write_text(dir / "src/mimetype", "application/epub+zip");
        test::write_text(dir / "blocker", "file");
        EXPECT_THROW(ContainerCodec().zip_strict(dir / "src", dir / "blocker/x.epub"),
                     ArchiveError);
    }


    TEST(ContainerCodec, RoundTripPreservesTree)
    {
        test::TempDir dir;
        const std::string payload(200000, 'q');
        test::write_text(dir / "src/mimetype", "application/epub+zip");
        test::write_text(dir / "src/OEBPS/big.bin", payload);
        const fs::path out = dir / "book.epub";
        ContainerCodec codec(4096);
        (void)codec.zip_strict(dir / "src", out);

        const UnzipResult result = codec.unzip(out, dir / "back");
        EXPECT_EQ(result.extracted, 2U);
        EXPECT_TRUE(result.skipped.empty());
        EXPECT_EQ(read_text(dir / "back/OEBPS/big.bin"), payload);
    }

}  // namespace
}  // namespace scour
