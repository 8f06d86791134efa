/**
 * @file events.hpp
 * @brief Event types emitted by the upload engine
 *
 * NAMING CONVENTION:
 * - Events are past-tense: UploadStartedEvent, ChunkAcknowledgedEvent
 *
 * Every event carries the remote session id so that observers of a bus
 * shared by several parallel uploads can tell them apart.
 */

#pragma once

#include "adpush/core/error.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace adpush::events {

/**
 * @brief Emitted once the remote endpoint has issued a session
 *
 * WHO SUBSCRIBES:
 * - Logger, Metrics, progress displays
 */
struct UploadStartedEvent {
    std::string session_id;
    uint64_t total_bytes = 0;
    uint64_t start_offset = 0;
    uint32_t session_attempt = 1;   // > 1 after a whole-upload restart
};

/**
 * @brief Emitted after each chunk push the remote acknowledged with progress
 *
 * committed_offset is the remote-provided next offset. bytes_sent may exceed
 * the progress made when the remote accepted only a prefix.
 */
struct ChunkAcknowledgedEvent {
    std::string session_id;
    uint64_t start_offset = 0;
    uint64_t bytes_sent = 0;
    uint64_t committed_offset = 0;
    uint64_t total_bytes = 0;
    uint32_t attempts = 1;
};

/// A chunk push failed transiently and will be retried after delay
struct ChunkRetryScheduledEvent {
    std::string session_id;
    uint64_t start_offset = 0;
    uint32_t attempt = 0;
    std::chrono::milliseconds delay{0};
    std::string reason;
};

/// The remote asked to resend from an offset below what it had already acknowledged
struct OffsetRewoundEvent {
    std::string session_id;
    uint64_t from_offset = 0;
    uint64_t to_offset = 0;
};

/// Usage headers crossed the threshold; the upload waits before the next request
struct RateLimitPauseEvent {
    std::string session_id;
    std::chrono::milliseconds pause{0};
};

struct UploadCompletedEvent {
    std::string session_id;
    std::string asset_id;
    uint64_t total_bytes = 0;
    std::chrono::milliseconds duration{0};
};

/**
 * @brief Emitted when an upload ends in a terminal failure
 *
 * Not emitted for cancellation; see UploadCancelledEvent.
 */
struct UploadFailedEvent {
    std::string session_id;
    UploadError error;
};

struct UploadCancelledEvent {
    std::string session_id;
    uint64_t committed_offset = 0;
};

} // namespace adpush::events
