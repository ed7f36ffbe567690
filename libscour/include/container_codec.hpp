/**
 * @file container_codec.hpp
 * @brief ZIP extraction with traversal protection and OCF-ordered repacking.
 */

#ifndef SCOUR_CONTAINER_CODEC_HPP
#define SCOUR_CONTAINER_CODEC_HPP

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace scour {

/**
 * @brief An archive entry that unzip() refused to write.
 */
struct SkippedEntry {
    std::string name;   ///< Name as stored in the archive
    std::string reason;
};

struct UnzipResult {
    std::size_t extracted = 0;          ///< Regular files written
    std::vector<SkippedEntry> skipped;
};

/**
 * @brief Streams EPUB containers in and out through libarchive.
 *
 * @details unzip() never writes outside its destination: every entry name is
 * resolved lexically and must land strictly inside the root, otherwise the
 * entry is skipped and extraction continues. Symlinks and special files are
 * skipped as well.
 *
 * zip_strict() writes the OCF layout: a stored `mimetype` entry first, then
 * every other regular file deflated at level 9, in sorted order, with
 * forward-slash names.
 *
 * Failures to open the source, create the destination or read/write data
 * throw ArchiveError.
 */
class ContainerCodec {
public:
    static constexpr std::string_view kDefaultMimetype = "application/epub+zip";

    /**
     * @param block_size Size of the copy buffer used for entry payloads.
     */
    explicit ContainerCodec(std::size_t block_size = 64 * 1024);

    /**
     * @brief Extracts archive_path into dest_root (created if missing).
     * @throws ArchiveError
     */
    [[nodiscard]] UnzipResult unzip(const std::filesystem::path& archive_path,
                                    const std::filesystem::path& dest_root) const;

    /**
     * @brief Packs src_root into dest_file.
     *
     * A missing `mimetype` file is replaced by kDefaultMimetype. The partial
     * output is removed on failure.
     *
     * @return Number of entries written, `mimetype` included.
     * @throws ArchiveError
     */
    std::size_t zip_strict(const std::filesystem::path& src_root,
                           const std::filesystem::path& dest_file) const;

    /**
     * @brief Where an entry would be extracted, if that is strictly inside dest_root.
     *
     * Backslashes count as separators. Empty names, absolute names, names
     * with NUL and names normalizing to dest_root itself or above it yield
     * std::nullopt.
     */
    [[nodiscard]] static std::optional<std::filesystem::path> resolve_entry_path(
        std::string_view entry_name, const std::filesystem::path& dest_root);

    /**
     * @brief Content of a mimetype file with trailing whitespace removed.
     */
    [[nodiscard]] static std::string trim_mimetype(std::string content);

private:
    std::size_t block_size_;
};

} // namespace scour

#endif // SCOUR_CONTAINER_CODEC_HPP
