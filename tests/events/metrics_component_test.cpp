#include "mpcopy/events/event_bus.hpp"
#include "mpcopy/events/components.hpp"
#include "mpcopy/events/events.hpp"

#include <gtest/gtest.h>

#include <chrono>

using mpcopy::events::CopyAbortedEvent;
using mpcopy::events::CopyCompletedEvent;
using mpcopy::events::CopyFailedEvent;
using mpcopy::events::CopyStartedEvent;
using mpcopy::events::EventBus;
using mpcopy::events::LoggerComponent;
using mpcopy::events::MetricsComponent;
using mpcopy::events::PartCopiedEvent;
using mpcopy::events::PartCopyFailedEvent;

TEST(MetricsComponentTest, TracksCopyAndPartCounters) {
    EventBus bus;
    MetricsComponent metrics(bus);

    bus.emit(CopyStartedEvent{{"src", "a"}, {"dst", "b"}, 120'000'000, 50'000'000, 2, std::string("req-1")});
    bus.emit(PartCopiedEvent{"upload-1", 1, 50'000'000, "\"x\"", std::chrono::milliseconds{20}});
    bus.emit(PartCopiedEvent{"upload-1", 2, 70'000'000, "\"y\"", std::chrono::milliseconds{25}});
    bus.emit(CopyCompletedEvent{{"dst", "b"}, "upload-1", "\"z-2\"", 2, 120'000'000, std::chrono::milliseconds{50}});

    const auto& stats = metrics.get_stats();
    EXPECT_EQ(stats.copies_started.load(), 1u);
    EXPECT_EQ(stats.copies_completed.load(), 1u);
    EXPECT_EQ(stats.parts_copied.load(), 2u);
    EXPECT_EQ(stats.bytes_copied.load(), 120'000'000u);
    EXPECT_EQ(stats.copies_aborted.load(), 0u);
}

TEST(MetricsComponentTest, SeparatesCleanAbortsFromLeftovers) {
    EventBus bus;
    MetricsComponent metrics(bus);

    bus.emit(PartCopyFailedEvent{"upload-1", 2, "TransportFailure: reset"});
    bus.emit(CopyAbortedEvent{{"dst", "b"}, "upload-1", true, 0, "part 2 failed"});
    bus.emit(CopyAbortedEvent{{"dst", "c"}, "upload-2", false, 3, "part 1 failed"});
    bus.emit(CopyFailedEvent{{"dst", "d"}, "initiate", "AccessDenied"});

    const auto& stats = metrics.get_stats();
    EXPECT_EQ(stats.parts_failed.load(), 1u);
    EXPECT_EQ(stats.copies_aborted.load(), 2u);
    EXPECT_EQ(stats.abort_inconsistencies.load(), 1u);
    EXPECT_EQ(stats.copies_failed.load(), 1u);
}

TEST(MetricsComponentTest, UnsubscribesOnDestruction) {
    EventBus bus;
    {
        MetricsComponent metrics(bus);
        LoggerComponent logger(bus);
        EXPECT_EQ(bus.subscriber_count<CopyStartedEvent>(), 2u);
    }
    EXPECT_EQ(bus.subscriber_count<CopyStartedEvent>(), 0u);
    EXPECT_EQ(bus.subscriber_count<PartCopiedEvent>(), 0u);

    EXPECT_NO_THROW(bus.emit(CopyStartedEvent{{"src", "a"}, {"dst", "b"}, 1, 5'242'880, 1}));
}
