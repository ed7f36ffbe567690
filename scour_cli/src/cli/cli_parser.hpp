#ifndef SCOUR_CLI_PARSER_HPP
#define SCOUR_CLI_PARSER_HPP

#include "../../../libscour/include/sanitize_config.hpp"
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

// forward declaration
namespace CLI { class App; }

struct Settings {
    bool quiet = false;
    bool no_fast_path = false;

    unsigned num_threads = 8;
    std::uint32_t dpi = 96;
    std::uint32_t max_long_side = 2500;
    int jpeg_quality = 95;

    std::string log_level = "WARNING";
    std::filesystem::path log_file;
    std::filesystem::path output_path;
    std::filesystem::path report_path;

    std::vector<std::filesystem::path> inputs;

    /// Library configuration for these options.
    [[nodiscard]] scour::SanitizeConfig to_config() const;
};

/**
 * @brief Configures the CLI11 parser with all options, flags, and arguments.
 * @param app The CLI::App instance to configure.
 * @param settings The Settings struct to map the options to.
 */
void setup_cli_parser(CLI::App& app, Settings& settings);

#endif // SCOUR_CLI_PARSER_HPP
