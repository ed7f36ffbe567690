#include "report_generator.hpp"
#include "../utils/color.hpp"
#include <algorithm>
#include <cstdio>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

#include <sys/ioctl.h>
#include <unistd.h>

using scour::SanitizeStatus;

static bool is_stderr_a_tty() {
    return isatty(fileno(stderr)) != 0;
}

unsigned get_terminal_width() {
    winsize w{};
    if (ioctl(STDERR_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0)
        return w.ws_col;
    return 80;
}

static std::string csv_escape(const std::string& data) {
    if (data.find_first_of(",\"\n\r") == std::string::npos) {
        return data;
    }
    std::string result;
    result.reserve(data.size() + 4);
    result.push_back('"');
    for (char c : data) {
        if (c == '"') {
            result.push_back('"'); // escape quote with another quote
        }
        result.push_back(c);
    }
    result.push_back('"');
    return result;
}

static std::string join_actions(const std::vector<std::string>& actions, const char* sep) {
    std::string out;
    for (size_t i = 0; i < actions.size(); ++i) {
        if (i) out += sep;
        out += actions[i];
    }
    return out;
}

static const char* status_color(const SanitizeStatus status) {
    switch (status) {
        case SanitizeStatus::Ok:       return GREEN;
        case SanitizeStatus::Repaired: return CYAN;
        case SanitizeStatus::Replaced: return YELLOW;
        case SanitizeStatus::Failed:   return RED;
    }
    return RESET;
}

void print_console_report(const std::vector<ReportRow>& rows,
                          const scour::AggregateStats& stats,
                          const double total_seconds) {
    const unsigned term_width = get_terminal_width();
    const bool use_colors = is_stderr_a_tty();

    size_t max_format = 8;
    size_t max_status = 10;
    size_t max_before = 12;
    size_t max_after = 12;
    for (const auto& row : rows) {
        max_format = std::max(max_format, row.report.original_format.size() + 2);
        max_before = std::max(max_before, std::to_string(row.report.size_before).size() + 2);
        max_after  = std::max(max_after,  std::to_string(row.report.size_after).size() + 2);
    }

    const size_t fixed_cols_width = max_format + max_status + max_before + max_after;
    const size_t file_col_width = term_width > fixed_cols_width + 20
                                ? std::min<size_t>(term_width - fixed_cols_width, 60)
                                : 20;

    auto truncate = [](const std::string& s, const size_t max_len) {
        return s.size() < max_len ? s : "..." + s.substr(s.size() - (max_len - 4));
    };

    std::cerr << "\n"
              << std::left << std::setw(static_cast<int>(file_col_width)) << "File"
              << std::setw(static_cast<int>(max_format)) << "Format"
              << std::setw(static_cast<int>(max_status)) << "Status"
              << std::setw(static_cast<int>(max_before)) << "Before(B)"
              << std::setw(static_cast<int>(max_after))  << "After(B)"
              << "\n";

    for (const auto& row : rows) {
        const auto& r = row.report;
        const std::string status = scour::status_to_string(r.status);
        std::cerr << std::left << std::setw(static_cast<int>(file_col_width))
                  << truncate(r.path.generic_string(), file_col_width)
                  << std::setw(static_cast<int>(max_format)) << (r.original_format.empty() ? "-" : r.original_format);
        if (use_colors) std::cerr << status_color(r.status);
        std::cerr << std::setw(static_cast<int>(max_status)) << status;
        if (use_colors) std::cerr << RESET;
        std::cerr << std::setw(static_cast<int>(max_before)) << r.size_before
                  << std::setw(static_cast<int>(max_after))  << r.size_after
                  << "\n";

        if (!r.actions.empty()) {
            std::cerr << "    Actions: " << join_actions(r.actions, " -> ") << "\n";
        }
        if (r.error) {
            std::cerr << "    Error: " << *r.error << "\n";
        }
    }

    std::cerr << "\nImages: " << stats.total
              << " (OK " << stats.ok
              << ", repaired " << stats.repaired
              << ", replaced " << stats.replaced
              << ", failed " << stats.failed << ")\n";
    std::cerr << "Size: " << (stats.bytes_before / 1024) << " KB -> " << (stats.bytes_after / 1024) << " KB\n";
    std::cerr << "Total time: " << std::fixed << std::setprecision(2) << total_seconds << " s\n";
}

bool export_csv_report(const std::vector<ReportRow>& rows,
                       const scour::AggregateStats& stats,
                       const std::filesystem::path& output_path,
                       const double total_seconds) {
    std::ofstream out(output_path);
    if (!out) return false;

    out << "Source,File,Format,Status,Actions,Before(B),After(B),Error\n";
    for (const auto& row : rows) {
        const auto& r = row.report;
        out << csv_escape(row.source.filename().string()) << ","
            << csv_escape(r.path.generic_string()) << ","
            << csv_escape(r.original_format) << ","
            << scour::status_to_string(r.status) << ","
            << csv_escape(join_actions(r.actions, ";")) << ","
            << r.size_before << ","
            << r.size_after << ","
            << csv_escape(r.error.value_or("")) << "\n";
    }

    out << "\n\nTotal,OK,Repaired,Replaced,Failed,Before(B),After(B),Time(s)\n";
    std::ostringstream osstime;
    osstime << std::fixed << std::setprecision(2) << total_seconds;
    out << stats.total << "," << stats.ok << "," << stats.repaired << ","
        << stats.replaced << "," << stats.failed << ","
        << stats.bytes_before << "," << stats.bytes_after << ","
        << osstime.str() << "\n";

    out.flush();
    return static_cast<bool>(out);
}
