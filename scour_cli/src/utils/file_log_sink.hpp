#ifndef SCOUR_FILE_LOG_SINK_HPP
#define SCOUR_FILE_LOG_SINK_HPP

#include "../../../libscour/include/log_sink.hpp"
#include "../../../libscour/include/logger.hpp"
#include <filesystem>
#include <fstream>
#include <mutex>

/**
 * @brief Appends every record, with its sequence number, to a log file.
 */
class FileLogSink final : public scour::ILogSink {
public:
    explicit FileLogSink(const std::filesystem::path& filename, const bool append = true)
        : out_(filename, append ? std::ios::app : std::ios::trunc) {}

    [[nodiscard]] bool is_open() const { return out_.is_open(); }

    void log(const scour::LogRecord& record) override {
        std::lock_guard lock(mtx_);
        if (!out_.is_open()) return;

        out_ << "#" << record.sequence << " [" << scour::Logger::level_to_string(record.level) << "]";
        if (!record.tag.empty()) out_ << "[" << record.tag << "]";
        out_ << " " << record.message << "\n";
        out_.flush();
    }

private:
    std::ofstream out_;
    std::mutex mtx_;
};

#endif // SCOUR_FILE_LOG_SINK_HPP
