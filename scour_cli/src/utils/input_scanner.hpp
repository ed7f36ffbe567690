#ifndef SCOUR_INPUT_SCANNER_HPP
#define SCOUR_INPUT_SCANNER_HPP

#include <filesystem>
#include <vector>

/**
 * @brief A command line input that passed validation.
 */
struct InputJob {
    std::filesystem::path path;
    bool is_directory = false; ///< Unpacked tree, sanitized in place
};

/**
 * @brief Keeps `.epub` files and directories; everything else is logged and dropped.
 * Duplicates (same canonical path) are dropped as well.
 */
std::vector<InputJob> collect_inputs(const std::vector<std::filesystem::path>& inputs);

#endif // SCOUR_INPUT_SCANNER_HPP
