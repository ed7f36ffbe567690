#ifndef SCOUR_LOG_SINK_HPP
#define SCOUR_LOG_SINK_HPP

#include <cstdint>
#include <string>

namespace scour {

/**
 * @brief Severity levels for log messages.
 *
 * These levels indicate the importance and type of a log entry.
 * They can be used by sinks to filter or format output accordingly.
 */
enum class LogLevel {
    Debug,   ///< Detailed diagnostic information, useful for developers
    Info,    ///< General informational messages about normal operation
    Warning, ///< Indications of potential issues or unexpected states
    Error    ///< Errors that require attention or intervention
};

/**
 * @brief A single log entry as delivered to sinks.
 *
 * Sequence numbers are assigned in submission order and never reused,
 * so a sink that sees a jump knows records went missing upstream.
 */
struct LogRecord {
    std::uint64_t sequence = 0; ///< Monotonic record number
    LogLevel level = LogLevel::Info;
    std::string message;
    std::string tag;            ///< Component that emitted the record
};

/**
 * @brief Abstract sink interface for logging.
 *
 * Implementations of ILogSink define how log records are delivered
 * (e.g. console, file, memory). The Logger class fans every record
 * out to all installed sinks.
 */
struct ILogSink {
    virtual ~ILogSink() = default;

    /**
     * @brief Deliver one record.
     * @param record The record, including its sequence number.
     */
    virtual void log(const LogRecord& record) = 0;
};

} // namespace scour

#endif // SCOUR_LOG_SINK_HPP
