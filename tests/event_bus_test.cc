#include "event_bus.hpp"
#include "events.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

namespace scour {
namespace {

    TEST(EventBus, DeliversByType)
    {
        EventBus bus;
        int progress = 0;
        int skipped  = 0;
        bus.subscribe<SanitizeProgressEvent>(
            [&](const SanitizeProgressEvent& e) { progress += static_cast<int>(e.done); });
        bus.subscribe<EntrySkippedEvent>([&](const EntrySkippedEvent&) { ++skipped; });

        bus.publish(SanitizeProgressEvent { 3, 10 });
        bus.publish(SanitizeProgressEvent { 4, 10 });
        EXPECT_EQ(progress, 7);
        EXPECT_EQ(skipped, 0);
    }


    TEST(EventBus, UnsubscribeStopsDelivery)
    {
        EventBus bus;
        int calls     = 0;
        const auto id = bus.subscribe<SanitizeProgressEvent>(
            [&](const SanitizeProgressEvent&) { ++calls; });
        bus.publish(SanitizeProgressEvent {});
        bus.unsubscribe(id);
        bus.unsubscribe(id + 100);
        bus.publish(SanitizeProgressEvent {});
        EXPECT_EQ(calls, 1);
    }


    TEST(EventBus, HandlerMayPublish)
    {
        EventBus bus;
        int complete = 0;
        bus.subscribe<SanitizeCompleteEvent>([&](const SanitizeCompleteEvent&) { ++complete; });
        bus.subscribe<SanitizeProgressEvent>([&](const SanitizeProgressEvent& e) {
            if (e.done == e.total) {
                bus.publish(SanitizeCompleteEvent {});
            }
        });
        bus.publish(SanitizeProgressEvent { 1, 2 });
        bus.publish(SanitizeProgressEvent { 2, 2 });
        EXPECT_EQ(complete, 1);
    }


    TEST(EventBus, ConcurrentPublishers)
    {
        EventBus bus;
        std::atomic<int> seen { 0 };
        bus.subscribe<FileSanitizedEvent>([&](const FileSanitizedEvent&) { seen.fetch_add(1); });
        {
            std::vector<std::jthread> threads;
            for (int t = 0; t < 4; ++t) {
                threads.emplace_back([&bus] {
                    for (int i = 0; i < 250; ++i) {
                        bus.publish(FileSanitizedEvent {});
                    }
                });
            }
        }
        EXPECT_EQ(seen.load(), 1000);
    }

}  // namespace
}  // namespace scour
