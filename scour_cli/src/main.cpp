#include <algorithm>
#include <atomic>
#include <chrono>
#include <clocale>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <unistd.h>
#include <CLI/CLI.hpp>
#include "cli/cli_parser.hpp"
#include "report/report_generator.hpp"
#include "utils/color.hpp"
#include "utils/console_log_sink.hpp"
#include "utils/file_log_sink.hpp"
#include "utils/input_scanner.hpp"
#include "../../libscour/include/errors.hpp"
#include "../../libscour/include/events.hpp"
#include "../../libscour/include/job_state.hpp"
#include "../../libscour/include/logger.hpp"
#include "../../libscour/include/scour.hpp"

using namespace scour;
namespace fs = std::filesystem;

// simple progress bar printer
static void print_progress_bar(const size_t done, const size_t total, const double elapsed_seconds) {
    const unsigned term_width = get_terminal_width();
    const unsigned bar_width = std::max(10u, term_width > 40u ? term_width - 40u : 20u);

    const double progress = total ? static_cast<double>(done) / static_cast<double>(total) : 1.0;
    const auto pos = static_cast<unsigned>(bar_width * progress);

    std::cerr << "\r[";
    for (unsigned i = 0; i < bar_width; ++i) {
        if (i < pos) std::cerr << "=";
        else if (i == pos && done < total) std::cerr << ">";
        else std::cerr << " ";
    }
    std::cerr << "] "
              << std::setw(5) << std::fixed << std::setprecision(1) << progress * 100.0 << "%"
              << " (" << done << "/" << total << ")"
              << " elapsed: " << std::fixed << std::setprecision(1) << elapsed_seconds << "s"
              << std::flush;
}

static void init_utf8_locale() {
    std::setlocale(LC_ALL, "");

    const char* cur = std::setlocale(LC_CTYPE, nullptr);
    if (cur && std::strstr(cur, "UTF-8") != nullptr) {
        return;
    }

    constexpr const char* fallbacks[] = {"C.UTF-8", "en_US.UTF-8"};
    for (const auto fb : fallbacks) {
        if (std::setlocale(LC_ALL, fb)) {
            Logger::log(LogLevel::Debug, std::string("Locale set to ") + fb, "main");
            return;
        }
    }

    Logger::log(LogLevel::Warning, "UTF-8 locale not available; non-ASCII file names may be problematic.", "main");
}

static void setup_logging(const Settings& settings) {
    Logger::clear_sinks();

    if (!settings.log_file.empty()) {
        auto file_sink = std::make_unique<FileLogSink>(settings.log_file, false);
        if (!file_sink->is_open()) {
            std::cerr << RED << "Cannot open log file: " << settings.log_file.string() << RESET << std::endl;
        } else {
            Logger::add_sink(std::move(file_sink));
        }
    }

    auto console_sink = std::make_unique<ConsoleLogSink>();
    console_sink->log_level = settings.quiet ? LogLevel::Error : Logger::string_to_level(settings.log_level);
    console_sink->use_colors = isatty(fileno(stderr)) != 0;
    Logger::add_sink(std::move(console_sink));

    Logger::start_channel();
}

int main(int argc, char* argv[]) {
    CLI::App app{"scour: sanitize the images embedded in EPUB books."};
    Settings settings;
    setup_cli_parser(app, settings);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    setup_logging(settings);
    init_utf8_locale();

    const auto inputs = collect_inputs(settings.inputs);
    if (inputs.empty()) {
        Logger::log(LogLevel::Error, "No valid input files.", "main");
        Logger::stop_channel();
        return 1;
    }

    JobState state;
    Scour scour(state);
    scour.configure(settings.to_config());

    // progress bar, fed from worker threads
    std::mutex progress_mtx;
    std::atomic<size_t> done{0};
    size_t total = 0;
    auto job_start = std::chrono::steady_clock::now();

    if (!settings.quiet) {
        scour.events().subscribe<SanitizeStartEvent>([&](const SanitizeStartEvent& e) {
            std::lock_guard lock(progress_mtx);
            done = 0;
            total = e.file_count;
            job_start = std::chrono::steady_clock::now();
        });
        scour.events().subscribe<FileSanitizedEvent>([&](const FileSanitizedEvent&) {
            const size_t current = ++done;
            std::lock_guard lock(progress_mtx);
            const double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - job_start).count();
            print_progress_bar(current, total, elapsed);
        });
        scour.events().subscribe<SanitizeCompleteEvent>([&](const SanitizeCompleteEvent&) {
            std::lock_guard lock(progress_mtx);
            std::cerr << "\n";
        });
        scour.events().subscribe<ArchiveWrittenEvent>([](const ArchiveWrittenEvent& e) {
            std::cerr << GREEN << "[DONE] " << e.path.string() << " (" << e.entries << " entries, "
                      << e.size / 1024 << " KB)" << RESET << std::endl;
        });
    }

    std::vector<ReportRow> rows;
    bool hard_failure = false;
    const auto start_total = std::chrono::steady_clock::now();

    for (const auto& input : inputs) {
        try {
            const JobResult result = input.is_directory
                ? scour.sanitizeDirectory(input.path)
                : scour.sanitizeEpub(input.path, settings.output_path);
            for (const auto& report : result.reports) {
                rows.push_back({input.path, report});
            }
        } catch (const ScourError& e) {
            Logger::log(LogLevel::Error, input.path.string() + ": " + e.what(), "main");
            hard_failure = true;
        }
    }

    const double total_seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_total).count();

    std::vector<SanitizationReport> all;
    all.reserve(rows.size());
    for (const auto& row : rows) all.push_back(row.report);
    const auto stats = AggregateStats::from(all);

    if (!settings.quiet) {
        print_console_report(rows, stats, total_seconds);
    }

    if (!settings.report_path.empty()) {
        if (!export_csv_report(rows, stats, settings.report_path, total_seconds)) {
            Logger::log(LogLevel::Error, "Cannot write report: " + settings.report_path.string(), "main");
            hard_failure = true;
        }
    }

    Logger::stop_channel();
    return hard_failure ? 1 : 0;
}
