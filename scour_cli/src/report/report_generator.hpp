#ifndef SCOUR_REPORT_GENERATOR_HPP
#define SCOUR_REPORT_GENERATOR_HPP

#include "../../../libscour/include/sanitization_report.hpp"
#include <filesystem>
#include <string>
#include <vector>

/**
 * @brief One line of the final report: a file report and the input it came from.
 */
struct ReportRow {
    std::filesystem::path source;  ///< .epub file or directory given on the command line
    scour::SanitizationReport report;
};

unsigned get_terminal_width();

/**
 * @brief Prints the per-file table and the aggregate statistics to stderr.
 */
void print_console_report(const std::vector<ReportRow>& rows,
                          const scour::AggregateStats& stats,
                          double total_seconds);

/**
 * @brief Writes the rows and the totals as CSV.
 * @return false if the file could not be written.
 */
bool export_csv_report(const std::vector<ReportRow>& rows,
                       const scour::AggregateStats& stats,
                       const std::filesystem::path& output_path,
                       double total_seconds);

#endif // SCOUR_REPORT_GENERATOR_HPP
