#include "cli_parser.hpp"
#include <CLI/CLI.hpp>
#include <algorithm>
#include <memory>

scour::SanitizeConfig Settings::to_config() const {
    scour::SanitizeConfig config;
    config.target_dpi = dpi;
    config.max_long_side = max_long_side;
    config.jpeg_quality = jpeg_quality;
    config.max_workers = std::max(1U, num_threads);
    config.enable_fast_path = !no_fast_path;
    return config;
}

void setup_cli_parser(CLI::App& app, Settings& settings) {
    app.set_help_flag("-h,--help", "Show this help message and exit.");
    app.set_version_flag("--version", "0.1");

    // options may also come from an INI file: key = value, one per line
    app.config_formatter(std::make_shared<CLI::ConfigINI>());
    app.set_config("--config", "", "Read options from an INI file.");

    // --- Flags (booleans) ---
    app.add_flag("-q,--quiet", settings.quiet,
                 "Suppress non-error console output (progress bar, results).");

    app.add_flag("--no-fast-path", settings.no_fast_path,
                 "Decode and re-encode every JPEG, even ones that only need a DPI patch.");

    // --- Options ---
    app.add_option("-o,--output", settings.output_path,
                   "Output archive (single .epub input only).\n"
                   "Default: <dir>/<stem>_sanitized.epub next to the input.");

    app.add_option("--report", settings.report_path,
                   "CSV report export filename.")
                   ->take_last();

    app.add_option("--threads", settings.num_threads,
                   "Maximum worker threads.")
                   ->default_val(settings.num_threads)
                   ->check(CLI::PositiveNumber);

    app.add_option("--dpi", settings.dpi,
                   "Density written into every image.")
                   ->default_val(settings.dpi)
                   ->check(CLI::Range(1, 65535));

    app.add_option("--max-long-side", settings.max_long_side,
                   "Downsample images whose longest side exceeds N pixels (0 disables).")
                   ->default_val(settings.max_long_side);

    app.add_option("--jpeg-quality", settings.jpeg_quality,
                   "libjpeg quality for re-encoded JPEGs.")
                   ->default_val(settings.jpeg_quality)
                   ->check(CLI::Range(1, 100));

    app.add_option("--log-level", settings.log_level,
                   "Log level: ERROR, WARNING, INFO, DEBUG.")
                   ->default_val("WARNING")
                   ->check(CLI::IsMember({"ERROR", "WARNING", "INFO", "DEBUG"}, CLI::ignore_case));

    app.add_option("--log-file", settings.log_file,
                   "Also write logs to a file (default: no file logging).");

    // --- Positional Arguments ---
    app.add_option("inputs", settings.inputs, ".epub files or unpacked EPUB directories")
        ->required()
        ->check(CLI::ExistingPath);

    // --- Cross-validation logic ---
    app.callback([&settings]() {
        if (settings.output_path.empty()) return;
        if (settings.inputs.size() > 1) {
            throw CLI::ValidationError("-o, --output can only be used with a single input.");
        }
        if (std::filesystem::is_directory(settings.inputs.front())) {
            throw CLI::ValidationError("-o, --output does not apply to directory inputs (sanitized in place).");
        }
    });
}
