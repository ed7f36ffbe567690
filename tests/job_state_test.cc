#include "job_state.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

namespace scour {
namespace {

    TEST(JobState, SecondClaimFails)
    {
        JobState state;
        EXPECT_FALSE(state.is_running());
        EXPECT_TRUE(state.try_begin());
        EXPECT_TRUE(state.is_running());
        EXPECT_FALSE(state.try_begin());
        state.end();
        EXPECT_FALSE(state.is_running());
        EXPECT_TRUE(state.try_begin());
    }


    TEST(JobState, LeaseReleasesOnScopeExit)
    {
        JobState state;
        {
            JobLease lease(state);
            EXPECT_TRUE(lease.acquired());
            JobLease second(state);
            EXPECT_FALSE(second.acquired());
        }
        EXPECT_FALSE(state.is_running());
    }


    TEST(JobState, OneWinnerUnderContention)
    {
        JobState state;
        std::atomic<int> winners { 0 };
        {
            std::vector<std::jthread> threads;
            for (int i = 0; i < 8; ++i) {
                threads.emplace_back([&] {
                    if (state.try_begin()) {
                        winners.fetch_add(1);
                    }
                });
            }
        }
        EXPECT_EQ(winners.load(), 1);
    }

}  // namespace
}  // namespace scour
