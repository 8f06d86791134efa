#include "adpush/events/components.hpp"
#include "adpush/events/event_bus.hpp"
#include "adpush/events/events.hpp"

#include <gtest/gtest.h>

#include <chrono>

using adpush::ErrorKind;
using adpush::make_error;
using namespace adpush::events;

TEST(MetricsComponentTest, TracksUploadLifecycleCounters) {
    EventBus bus;
    MetricsComponent metrics(bus);

    bus.emit(UploadStartedEvent{"session-1", 3000, 0, 1});
    bus.emit(ChunkAcknowledgedEvent{"session-1", 0, 1000, 1000, 3000, 1});
    bus.emit(ChunkRetryScheduledEvent{"session-1", 1000, 1, std::chrono::milliseconds(500), "503"});
    bus.emit(ChunkAcknowledgedEvent{"session-1", 1000, 1000, 1500, 3000, 2});  // prefix accepted
    bus.emit(OffsetRewoundEvent{"session-1", 1500, 1000});
    bus.emit(RateLimitPauseEvent{"session-1", std::chrono::milliseconds(10)});
    bus.emit(UploadCompletedEvent{"session-1", "video-1", 3000, std::chrono::milliseconds(200)});

    bus.emit(UploadStartedEvent{"session-2", 10, 0, 1});
    bus.emit(UploadFailedEvent{"session-2", make_error(ErrorKind::PermanentRejection, "bad token")});

    bus.emit(UploadStartedEvent{"session-3", 10, 0, 1});
    bus.emit(UploadCancelledEvent{"session-3", 0});

    const auto& stats = metrics.get_stats();
    EXPECT_EQ(stats.uploads_started.load(), 3u);
    EXPECT_EQ(stats.uploads_completed.load(), 1u);
    EXPECT_EQ(stats.uploads_failed.load(), 1u);
    EXPECT_EQ(stats.uploads_cancelled.load(), 1u);
    EXPECT_EQ(stats.chunks_acknowledged.load(), 2u);
    EXPECT_EQ(stats.chunk_retries.load(), 1u);
    EXPECT_EQ(stats.offset_rewinds.load(), 1u);
    EXPECT_EQ(stats.rate_limit_pauses.load(), 1u);
    EXPECT_EQ(stats.bytes_acknowledged.load(), 1500u);
    EXPECT_EQ(stats.bytes_completed.load(), 3000u);
}

TEST(MetricsComponentTest, LoggerAndMetricsShareOneBus) {
    EventBus bus;
    LoggerComponent logger(bus);
    MetricsComponent metrics(bus);

    EXPECT_EQ(bus.subscriber_count<UploadCompletedEvent>(), 2u);

    bus.emit(UploadCompletedEvent{"s", "video-9", 1, std::chrono::milliseconds(1)});
    EXPECT_EQ(metrics.get_stats().uploads_completed.load(), 1u);
}
