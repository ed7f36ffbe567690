#include "../../include/thread_pool.hpp"
#include "../../include/logger.hpp"
#include <string>

namespace scour {

ThreadPool::ThreadPool(const unsigned workers) {
    const unsigned n = workers > 0 ? workers : 1;
    workers_.reserve(n);
    for (unsigned i = 0; i < n; ++i) {
        workers_.emplace_back([this](const std::stop_token& st) { drain(st); });
    }
    Logger::log(LogLevel::Debug, "Started " + std::to_string(n) + " worker(s)", "thread_pool");
}

ThreadPool::~ThreadPool() {
    {
        std::lock_guard lock(mtx_);
        closing_ = true;
    }
    work_ready_.notify_all();
    // workers_ is destroyed next: each jthread joins once the queue is empty
}

void ThreadPool::drain(const std::stop_token& st) {
    for (;;) {
        std::function<void(const std::stop_token&)> job;
        {
            std::unique_lock lock(mtx_);
            work_ready_.wait(lock, [this] { return closing_ || !queue_.empty(); });
            if (queue_.empty()) return;
            job = std::move(queue_.front());
            queue_.pop_front();
        }
        job(st);
    }
}

} // namespace scour
