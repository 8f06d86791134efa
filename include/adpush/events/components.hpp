/**
 * @file components.hpp
 * @brief Ready-made observers for the upload event stream
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * UploadCoordinator coordinator(client, &bus);
 */

#pragma once

#include "adpush/events/event_bus.hpp"
#include "adpush/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>

namespace adpush::events {

/**
 * @brief Logs every upload event using spdlog
 *
 * Per-chunk progress goes to debug; retries, rewinds and rate-limit pauses to warn.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<UploadStartedEvent>([](const UploadStartedEvent& e) {
            spdlog::info("[UploadStarted] session={} bytes={} start_offset={} attempt={}",
                         e.session_id, e.total_bytes, e.start_offset, e.session_attempt);
        });

        bus_.subscribe<ChunkAcknowledgedEvent>([](const ChunkAcknowledgedEvent& e) {
            spdlog::debug("[ChunkAcknowledged] session={} offset={} sent={} committed={}/{} attempts={}",
                          e.session_id, e.start_offset, e.bytes_sent, e.committed_offset,
                          e.total_bytes, e.attempts);
        });

        bus_.subscribe<ChunkRetryScheduledEvent>([](const ChunkRetryScheduledEvent& e) {
            spdlog::warn("[ChunkRetry] session={} offset={} attempt={} delay={}ms reason={}",
                         e.session_id, e.start_offset, e.attempt, e.delay.count(), e.reason);
        });

        bus_.subscribe<OffsetRewoundEvent>([](const OffsetRewoundEvent& e) {
            spdlog::warn("[OffsetRewound] session={} from={} to={}",
                         e.session_id, e.from_offset, e.to_offset);
        });

        bus_.subscribe<RateLimitPauseEvent>([](const RateLimitPauseEvent& e) {
            spdlog::warn("[RateLimitPause] session={} pause={}ms", e.session_id, e.pause.count());
        });

        bus_.subscribe<UploadCompletedEvent>([](const UploadCompletedEvent& e) {
            spdlog::info("[UploadCompleted] session={} asset={} bytes={} duration={}ms",
                         e.session_id, e.asset_id, e.total_bytes, e.duration.count());
        });

        bus_.subscribe<UploadFailedEvent>([](const UploadFailedEvent& e) {
            spdlog::error("[UploadFailed] session={} {}", e.session_id, e.error.describe());
        });

        bus_.subscribe<UploadCancelledEvent>([](const UploadCancelledEvent& e) {
            spdlog::info("[UploadCancelled] session={} committed={}", e.session_id, e.committed_offset);
        });
    }

private:
    EventBus& bus_;
};

/**
 * @brief Counts upload activity for monitoring
 *
 * USAGE:
 * MetricsComponent metrics(bus);
 * // Later...
 * auto& stats = metrics.get_stats();
 * spdlog::info("Retries: {}", stats.chunk_retries.load());
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> uploads_started{0};
        std::atomic<uint64_t> uploads_completed{0};
        std::atomic<uint64_t> uploads_failed{0};
        std::atomic<uint64_t> uploads_cancelled{0};
        std::atomic<uint64_t> chunks_acknowledged{0};
        std::atomic<uint64_t> chunk_retries{0};
        std::atomic<uint64_t> offset_rewinds{0};
        std::atomic<uint64_t> rate_limit_pauses{0};
        std::atomic<uint64_t> bytes_acknowledged{0};
        std::atomic<uint64_t> bytes_completed{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<UploadStartedEvent>([this](const UploadStartedEvent&) {
            stats_.uploads_started++;
        });

        bus_.subscribe<ChunkAcknowledgedEvent>([this](const ChunkAcknowledgedEvent& e) {
            on_chunk_acknowledged(e);
        });

        bus_.subscribe<ChunkRetryScheduledEvent>([this](const ChunkRetryScheduledEvent&) {
            stats_.chunk_retries++;
        });

        bus_.subscribe<OffsetRewoundEvent>([this](const OffsetRewoundEvent&) {
            stats_.offset_rewinds++;
        });

        bus_.subscribe<RateLimitPauseEvent>([this](const RateLimitPauseEvent&) {
            stats_.rate_limit_pauses++;
        });

        bus_.subscribe<UploadCompletedEvent>([this](const UploadCompletedEvent& e) {
            stats_.uploads_completed++;
            stats_.bytes_completed += e.total_bytes;
        });

        bus_.subscribe<UploadFailedEvent>([this](const UploadFailedEvent&) {
            stats_.uploads_failed++;
        });

        bus_.subscribe<UploadCancelledEvent>([this](const UploadCancelledEvent&) {
            stats_.uploads_cancelled++;
        });
    }

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Upload Statistics:");
        spdlog::info("  Started:         {}", stats_.uploads_started.load());
        spdlog::info("  Completed:       {}", stats_.uploads_completed.load());
        spdlog::info("  Failed:          {}", stats_.uploads_failed.load());
        spdlog::info("  Cancelled:       {}", stats_.uploads_cancelled.load());
        spdlog::info("  Chunks acked:    {}", stats_.chunks_acknowledged.load());
        spdlog::info("  Chunk retries:   {}", stats_.chunk_retries.load());
        spdlog::info("  Offset rewinds:  {}", stats_.offset_rewinds.load());
        spdlog::info("  Rate pauses:     {}", stats_.rate_limit_pauses.load());
        spdlog::info("  Bytes acked:     {}", stats_.bytes_acknowledged.load());
        spdlog::info("  Bytes completed: {}", stats_.bytes_completed.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    void on_chunk_acknowledged(const ChunkAcknowledgedEvent& e) {
        stats_.chunks_acknowledged++;
        if (e.committed_offset > e.start_offset) {
            stats_.bytes_acknowledged += e.committed_offset - e.start_offset;
        }
    }

    EventBus& bus_;
    Stats stats_;
};

} // namespace adpush::events
