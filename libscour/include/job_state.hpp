#ifndef SCOUR_JOB_STATE_HPP
#define SCOUR_JOB_STATE_HPP

#include <atomic>

namespace scour {

    /**
     * @brief "A job is running" flag, claimed with compare-and-swap.
     *
     * Owned by whoever hosts jobs (the CLI, a GUI) and passed by reference
     * to every Scour instance that must not run concurrently with the others.
     */
    class JobState {
    public:
        /// @return true if the caller now owns the job slot.
        [[nodiscard]] bool try_begin() noexcept {
            bool expected = false;
            return running_.compare_exchange_strong(expected, true, std::memory_order_acq_rel);
        }

        void end() noexcept { running_.store(false, std::memory_order_release); }

        [[nodiscard]] bool is_running() const noexcept { return running_.load(std::memory_order_acquire); }

    private:
        std::atomic<bool> running_{false};
    };

    /**
     * @brief RAII claim on a JobState; releases it on destruction if acquired.
     */
    class JobLease {
    public:
        explicit JobLease(JobState& state) noexcept : state_(state), acquired_(state.try_begin()) {}
        ~JobLease() { if (acquired_) state_.end(); }

        JobLease(const JobLease&) = delete;
        JobLease& operator=(const JobLease&) = delete;

        [[nodiscard]] bool acquired() const noexcept { return acquired_; }

    private:
        JobState& state_;
        bool acquired_;
    };

} // namespace scour

#endif // SCOUR_JOB_STATE_HPP
