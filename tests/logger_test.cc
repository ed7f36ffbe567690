#include "logger.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace scour {
namespace {

    static std::vector<LogRecord> tagged(const test::MemoryLogSink& sink,
                                         const std::string& tag)
    {
        std::vector<LogRecord> out;
        for (const auto& r : sink.records()) {
            if (r.tag == tag) {
                out.push_back(r);
            }
        }
        return out;
    }


    class LoggerTest : public ::testing::Test {
    protected:
        void SetUp() override
        {
            auto sink = std::make_unique<test::MemoryLogSink>();
            sink_     = sink.get();
            Logger::add_sink(std::move(sink));
        }

        void TearDown() override
        {
            Logger::stop_channel();
            Logger::clear_sinks();
        }

        test::MemoryLogSink* sink_ = nullptr;
    };


    TEST_F(LoggerTest, SynchronousDelivery)
    {
        Logger::log(LogLevel::Info, "first", "logger_test");
        Logger::log(LogLevel::Warning, "second", "logger_test");

        const auto records = tagged(*sink_, "logger_test");
        ASSERT_EQ(records.size(), 2U);
        EXPECT_EQ(records[0].message, "first");
        EXPECT_EQ(records[0].level, LogLevel::Info);
        EXPECT_EQ(records[1].level, LogLevel::Warning);
        EXPECT_LT(records[0].sequence, records[1].sequence);
    }


    TEST_F(LoggerTest, ChannelKeepsOrderAcrossProducers)
    {
        Logger::start_channel(8);
        {
            std::vector<std::jthread> producers;
            for (int t = 0; t < 4; ++t) {
                producers.emplace_back([t] {
                    for (int i = 0; i < 100; ++i) {
                        Logger::log(LogLevel::Debug,
                                    std::to_string(t) + ":" + std::to_string(i),
                                    "logger_channel");
                    }
                });
            }
        }
        Logger::stop_channel();

        const auto records = tagged(*sink_, "logger_channel");
        ASSERT_EQ(records.size(), 400U);
        for (size_t i = 1; i < records.size(); ++i) {
            EXPECT_LT(records[i - 1].sequence, records[i].sequence);
        }
    }


    TEST_F(LoggerTest, SequenceContinuesAfterChannelStops)
    {
        Logger::start_channel();
        Logger::log(LogLevel::Info, "queued", "logger_seq");
        Logger::stop_channel();
        Logger::log(LogLevel::Info, "direct", "logger_seq");

        const auto records = tagged(*sink_, "logger_seq");
        ASSERT_EQ(records.size(), 2U);
        EXPECT_EQ(records[0].message, "queued");
        EXPECT_LT(records[0].sequence, records[1].sequence);
    }


    TEST(LogChannel, ConcurrentCloseWaitsForBacklog)
    {
        std::atomic<uint64_t> sequence { 0 };
        std::atomic<int> delivered { 0 };
        LogChannel channel(64, [&delivered](const LogRecord&) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            delivered.fetch_add(1);
        }, sequence);

        for (int i = 0; i < 50; ++i) {
            ASSERT_TRUE(channel.push(LogLevel::Debug, std::to_string(i), "close"));
        }

        std::vector<int> seen(4, -1);
        {
            std::vector<std::jthread> closers;
            for (size_t t = 0; t < seen.size(); ++t) {
                closers.emplace_back([&channel, &delivered, &seen, t] {
                    channel.close();
                    seen[t] = delivered.load();
                });
            }
        }

        for (const int n : seen) {
            EXPECT_EQ(n, 50);
        }
        EXPECT_FALSE(channel.push(LogLevel::Debug, "late", "close"));
        channel.close();
        EXPECT_EQ(delivered.load(), 50);
    }


    TEST(LoggerLevels, StringRoundTrip)
    {
        EXPECT_STREQ(Logger::level_to_string(LogLevel::Warning), "WARN");
        EXPECT_EQ(Logger::string_to_level("WARNING"), LogLevel::Warning);
        EXPECT_EQ(Logger::string_to_level("WARN"), LogLevel::Warning);
        EXPECT_EQ(Logger::string_to_level("DEBUG"), LogLevel::Debug);
        EXPECT_EQ(Logger::string_to_level("bogus"), LogLevel::Error);
    }

}  // namespace
}  // namespace scour
