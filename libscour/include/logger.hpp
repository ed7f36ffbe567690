/**
 * @file logger.hpp
 * @brief Provides a static, thread-safe logging facade.
 *
 * This file defines the Logger class, which serves as the global entry
 * point for all logging within the library, and the LogChannel that
 * decouples producers from sink I/O once it is started.
 */

#ifndef SCOUR_LOGGER_HPP
#define SCOUR_LOGGER_HPP

#include "log_sink.hpp"
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace scour {

/**
 * @brief Bounded multi-producer, single-consumer queue of log records.
 *
 * @details Records are stamped with a sequence number under the queue
 * lock, so queue order and sequence order always agree. A producer that
 * finds the queue full blocks until the consumer catches up; records are
 * never dropped. close() drains whatever is queued and joins the consumer.
 */
class LogChannel {
public:
    using Consumer = std::function<void(const LogRecord&)>;

    static constexpr std::size_t kDefaultCapacity = 1024;

    /**
     * @param capacity Maximum number of queued records (at least 1).
     * @param consumer Invoked on the consumer thread for every record.
     * @param sequence Counter the sequence numbers are drawn from; must outlive the channel.
     */
    LogChannel(std::size_t capacity, Consumer consumer, std::atomic<std::uint64_t>& sequence);
    ~LogChannel();

    LogChannel(const LogChannel&) = delete;
    LogChannel& operator=(const LogChannel&) = delete;

    /**
     * @brief Enqueue a record, blocking while the queue is full.
     * @return false if the channel was already closed and the record was rejected.
     */
    bool push(LogLevel level, std::string message, std::string tag);

    /**
     * @brief Stop accepting records, deliver the backlog and join the consumer.
     * Safe to call more than once and from several threads; every caller
     * returns after the backlog was delivered.
     */
    void close();

private:
    void run(const std::stop_token& st);

    std::mutex mtx_;
    std::condition_variable_any not_empty_;
    std::condition_variable not_full_;
    std::deque<LogRecord> queue_;
    std::size_t capacity_;
    std::atomic<std::uint64_t>& sequence_;
    bool closed_{false};
    bool join_claimed_{false};
    bool joined_{false};
    std::condition_variable joined_cv_;
    Consumer consumer_;
    std::jthread worker_; ///< Starts after the state above; run() never reads worker_id_
    std::thread::id worker_id_;
};

/**
 * @brief Static logging facade for scour.
 *
 * Provides a global, thread-safe entry point for logging. Without a
 * running channel records are delivered synchronously on the calling
 * thread. After start_channel() they travel through a LogChannel and a
 * single consumer thread writes them to the sinks.
 */
class Logger {
public:
    /**
     * @brief Add a new log sink to the logger.
     * The Logger takes ownership of the sink.
     * @param sink Unique pointer to a sink implementation.
     */
    static void add_sink(std::unique_ptr<ILogSink> sink);

    /**
     * @brief Remove all configured sinks.
     */
    static void clear_sinks();

    /**
     * @brief Log a message to all registered sinks.
     * @param level Severity level.
     * @param msg Message text.
     * @param tag Optional tag (default: "scour").
     */
    static void log(LogLevel level,
                    std::string_view msg,
                    std::string_view tag = "scour");

    /**
     * @brief Route subsequent records through a bounded channel.
     * No-op if a channel is already running.
     * @param capacity Queue capacity of the channel.
     */
    static void start_channel(std::size_t capacity = LogChannel::kDefaultCapacity);

    /**
     * @brief Drain and stop the channel; later records are delivered synchronously.
     */
    static void stop_channel();

    static const char* level_to_string(const LogLevel level) {
        switch (level) {
            case LogLevel::Debug:   return "DEBUG";
            case LogLevel::Info:    return "INFO";
            case LogLevel::Warning: return "WARN";
            case LogLevel::Error:   return "ERROR";
        }
        return "";
    }

    /**
     * @brief Converts a string to its LogLevel enum representation.
     * Case-sensitive. Returns LogLevel::Error if not matched.
     * @param level The string value (e.g., "DEBUG", "INFO").
     * @return The corresponding LogLevel enum.
     */
    static LogLevel string_to_level(const std::string& level) {
        if (level == "DEBUG")
            return LogLevel::Debug;
        if (level == "INFO")
            return LogLevel::Info;
        if (level == "WARNING" || level == "WARN")
            return LogLevel::Warning;
        return LogLevel::Error;
    }

private:
    static void dispatch(const LogRecord& record);

    ///< List of all registered sink implementations.
    static std::vector<std::unique_ptr<ILogSink>> sinks_;
    ///< Protects sinks_ and channel_.
    static std::mutex mtx_;
    ///< Active channel, null while logging synchronously.
    static std::shared_ptr<LogChannel> channel_;
    ///< Source of record sequence numbers, shared with the channel.
    static std::atomic<std::uint64_t> sequence_;
};

} // namespace scour

#endif // SCOUR_LOGGER_HPP
