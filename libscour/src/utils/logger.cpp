#include "../../include/logger.hpp"
#include <utility>

namespace scour {

std::vector<std::unique_ptr<ILogSink>> Logger::sinks_;
std::mutex Logger::mtx_;
std::shared_ptr<LogChannel> Logger::channel_;
std::atomic<std::uint64_t> Logger::sequence_{0};

LogChannel::LogChannel(const std::size_t capacity, Consumer consumer, std::atomic<std::uint64_t>& sequence)
    : capacity_(capacity == 0 ? 1 : capacity),
      sequence_(sequence),
      consumer_(std::move(consumer)),
      worker_([this](const std::stop_token& st) { run(st); }),
      worker_id_(worker_.get_id()) {}

LogChannel::~LogChannel() {
    close();
}

bool LogChannel::push(const LogLevel level, std::string message, std::string tag) {
    {
        std::unique_lock lock(mtx_);
        not_full_.wait(lock, [this] { return closed_ || queue_.size() < capacity_; });
        if (closed_) return false;
        queue_.push_back(LogRecord{sequence_.fetch_add(1), level, std::move(message), std::move(tag)});
    }
    not_empty_.notify_one();
    return true;
}

void LogChannel::close() {
    {
        std::unique_lock lock(mtx_);
        closed_ = true;
        if (join_claimed_) {
            // another caller owns the join; the consumer itself must not wait for it
            if (std::this_thread::get_id() != worker_id_) {
                joined_cv_.wait(lock, [this] { return joined_; });
            }
            return;
        }
        join_claimed_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
    if (worker_.joinable() && worker_id_ != std::this_thread::get_id()) {
        worker_.join();
    }
    {
        std::lock_guard lock(mtx_);
        joined_ = true;
    }
    joined_cv_.notify_all();
}

void LogChannel::run(const std::stop_token& st) {
    for (;;) {
        LogRecord record;
        {
            std::unique_lock lock(mtx_);
            not_empty_.wait(lock, st, [this] { return closed_ || !queue_.empty(); });
            if (queue_.empty()) {
                // closed (or stop requested) with nothing left to deliver
                if (closed_ || st.stop_requested()) return;
                continue;
            }
            record = std::move(queue_.front());
            queue_.pop_front();
        }
        not_full_.notify_one();
        if (consumer_) consumer_(record);
    }
}

void Logger::add_sink(std::unique_ptr<ILogSink> sink) {
    std::lock_guard lock(mtx_);
    if (sink) {
        sinks_.push_back(std::move(sink));
    }
}

void Logger::clear_sinks() {
    std::lock_guard lock(mtx_);
    sinks_.clear();
}

void Logger::dispatch(const LogRecord& record) {
    std::lock_guard lock(mtx_);
    for (const auto& sink : sinks_) {
        if (sink) {
            sink->log(record);
        }
    }
}

void Logger::log(const LogLevel level,
                 const std::string_view msg,
                 const std::string_view tag) {
    std::shared_ptr<LogChannel> channel;
    {
        std::lock_guard lock(mtx_);
        channel = channel_;
        if (!channel) {
            const LogRecord record{sequence_.fetch_add(1), level, std::string(msg), std::string(tag)};
            for (const auto& sink : sinks_) {
                if (sink) {
                    sink->log(record);
                }
            }
            return;
        }
    }
    // pushing may block on a full queue, so the sink lock must not be held here
    if (!channel->push(level, std::string(msg), std::string(tag))) {
        // channel closed underneath us while stopping
        dispatch(LogRecord{sequence_.fetch_add(1), level, std::string(msg), std::string(tag)});
    }
}

void Logger::start_channel(const std::size_t capacity) {
    std::lock_guard lock(mtx_);
    if (channel_) return;
    channel_ = std::make_shared<LogChannel>(capacity, &Logger::dispatch, sequence_);
}

void Logger::stop_channel() {
    std::shared_ptr<LogChannel> channel;
    {
        std::lock_guard lock(mtx_);
        channel = std::move(channel_);
        channel_.reset();
    }
    if (channel) channel->close();
}

} // namespace scour
