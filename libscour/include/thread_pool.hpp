/**
 * @file thread_pool.hpp
 * @brief Bounded set of workers the orchestrator fans image files over.
 */

#ifndef SCOUR_THREAD_POOL_HPP
#define SCOUR_THREAD_POOL_HPP

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <stop_token>
#include <thread>
#include <vector>

namespace scour {

/**
 * @brief Fixed number of std::jthread workers draining one FIFO queue.
 *
 * @details There is no cancellation: the destructor lets the workers finish
 * everything already queued, then joins them. A task's exception is stored
 * in the future enqueue() returned.
 */
class ThreadPool {
public:
    /**
     * @param workers Number of threads; 0 is treated as 1.
     */
    explicit ThreadPool(unsigned workers);

    /// Drains the queue and joins the workers.
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief Queue a callable taking the worker's `std::stop_token`.
     * @throws std::runtime_error once the pool is closing.
     */
    template<class F>
    auto enqueue(F&& f) -> std::future<std::invoke_result_t<F, std::stop_token>> {
        using R = std::invoke_result_t<F, std::stop_token>;
        auto job = std::make_shared<std::packaged_task<R(std::stop_token)>>(std::forward<F>(f));
        auto result = job->get_future();
        {
            std::lock_guard lock(mtx_);
            if (closing_) throw std::runtime_error("ThreadPool is closing");
            queue_.emplace_back([job](const std::stop_token& st) { (*job)(st); });
        }
        work_ready_.notify_one();
        return result;
    }

    [[nodiscard]] std::size_t size() const noexcept { return workers_.size(); }

private:
    void drain(const std::stop_token& st);

    std::mutex mtx_;
    std::condition_variable work_ready_;
    std::deque<std::function<void(const std::stop_token&)>> queue_;
    bool closing_{false};
    std::vector<std::jthread> workers_; ///< Last member: joined before the queue is destroyed
};

} // namespace scour

#endif // SCOUR_THREAD_POOL_HPP
