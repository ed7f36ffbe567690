#ifndef SCOUR_FILE_UTILS_HPP
#define SCOUR_FILE_UTILS_HPP

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace scour {

    /**
     * @brief Opens a file using a filesystem path, handling Windows Unicode correctly.
     * @param path The path to the file.
     * @param mode The standard C fopen mode string (e.g., "rb", "wb").
     * @return FILE* pointer or nullptr if open failed.
     */
    FILE *open_file(const std::filesystem::path &path, const char *mode);

    /**
     * @brief Creates a unique temporary directory for a job.
     *
     * Creates a directory inside the system temp path using a
     * "scour-{prefix}/{prefix}_{filename_stem}_{random_suffix}" pattern.
     *
     * @param input_path The input file path (used for its stem).
     * @param prefix A short prefix (e.g., "epub").
     * @return Filesystem path to the newly created temporary directory.
     * @throws ArchiveError if the directory cannot be created.
     */
    std::filesystem::path make_temp_dir_for(const std::filesystem::path &input_path,
                                            const std::string &prefix);

    /**
     * @brief Recursively removes a directory and logs any errors.
     * @param dir The path to the directory to be removed.
     * @param tag The logger tag.
     */
    void cleanup_temp_dir(const std::filesystem::path &dir,
                          std::string_view tag = "file_utils");

    /**
     * @brief Reads a whole file in chunks, refusing to go past a byte cap.
     * @param path File to read.
     * @param max_bytes Largest accepted size.
     * @param chunk_size Read granularity.
     * @throws DecompressedSizeError if the file holds more than max_bytes.
     * @throws DecodeError if the file cannot be opened or read.
     */
    std::vector<std::uint8_t> read_file_capped(const std::filesystem::path &path,
                                               std::uintmax_t max_bytes,
                                               std::size_t chunk_size = 64 * 1024);

    /**
     * @brief Replaces a file's content through a sibling temp file and rename.
     *
     * Readers see either the old or the new content, never a partial write.
     * The temp file is removed if any step fails.
     *
     * @throws ReencodeError if writing, flushing or renaming fails.
     */
    void write_file_atomic(const std::filesystem::path &target,
                           std::span<const std::uint8_t> data);

} // namespace scour

#endif // SCOUR_FILE_UTILS_HPP
