#ifndef SCOUR_CONSOLE_LOG_SINK_HPP
#define SCOUR_CONSOLE_LOG_SINK_HPP

#include "../../../libscour/include/log_sink.hpp"
#include "../../../libscour/include/logger.hpp"
#include "color.hpp"
#include <iostream>
#include <mutex>

/**
 * @brief Writes records at or above log_level to the terminal.
 * Warnings and errors go to stderr, the rest to stdout.
 */
class ConsoleLogSink final : public scour::ILogSink {
public:
    scour::LogLevel log_level = scour::LogLevel::Warning;
    bool use_colors = true;

    void log(const scour::LogRecord& record) override {
        if (record.level < log_level) return;

        const bool is_problem = record.level >= scour::LogLevel::Warning;
        std::ostream& out = is_problem ? std::cerr : std::cout;
        const char* color = record.level == scour::LogLevel::Error ? RED
                          : record.level == scour::LogLevel::Warning ? YELLOW
                          : GRAY;

        std::lock_guard lock(mtx_);
        if (use_colors) out << color;
        out << "[" << scour::Logger::level_to_string(record.level) << "]";
        if (!record.tag.empty()) out << "[" << record.tag << "]";
        out << " " << record.message;
        if (use_colors) out << RESET;
        out << "\n";
        if (is_problem) out.flush();
    }

private:
    std::mutex mtx_;
};

#endif // SCOUR_CONSOLE_LOG_SINK_HPP
