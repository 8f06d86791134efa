#pragma once

#include "adpush/core/cancellation.hpp"
#include "adpush/core/error.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace adpush::upload {

/// Opaque identifier of the committed remote asset (a video id)
using AssetId = std::string;

enum class SessionState {
    NotStarted,
    Started,
    Transferring,
    Finishing,
    Completed,
    Failed,
    Cancelled
};

const char* to_string(SessionState state) noexcept;

/**
 * @brief Snapshot of one resumable transfer
 */
struct UploadSessionInfo {
    std::string session_id;                 ///< Issued by the remote start phase
    std::uint64_t total_size = 0;
    std::uint64_t committed_offset = 0;     ///< Last offset acknowledged by the remote
    SessionState state = SessionState::NotStarted;
    std::chrono::system_clock::time_point created_at{};
    std::optional<UploadError> last_error;  ///< Populated when state == Failed
    AssetId asset_id;                       ///< Populated when state == Completed
    AssetId asset_hint;                     ///< Asset id announced by the start phase, if any
    std::uint32_t rewinds = 0;
};

struct StartResponse {
    std::string session_id;
    std::uint64_t start_offset = 0;
    std::optional<AssetId> asset_hint;
};

/// Byte range [start_offset, end_offset) of the source file within one session
struct ChunkRequest {
    std::string session_id;
    std::uint64_t start_offset = 0;
    std::uint64_t end_offset = 0;

    [[nodiscard]] std::uint64_t size() const noexcept { return end_offset - start_offset; }
};

/**
 * @brief Successful answer to a chunk push
 *
 * Either next_offset (more data wanted) or asset_id (upload complete) is set.
 * throttle asks the caller to pause before its next request.
 */
struct ChunkResult {
    std::optional<std::uint64_t> next_offset;
    std::optional<AssetId> asset_id;
    std::optional<std::chrono::milliseconds> throttle;
};

struct FinishResponse {
    std::optional<AssetId> asset_id;    ///< Empty when the remote only confirmed success
};

/// Attempt bookkeeping for a single ChunkRequest; never carried across chunks
struct RetryState {
    std::uint32_t attempts = 0;
    std::chrono::milliseconds elapsed_backoff{0};

    void reset() noexcept {
        attempts = 0;
        elapsed_backoff = std::chrono::milliseconds(0);
    }
};

/// Per-call deadline and cancellation handed to every remote operation
struct CallOptions {
    std::chrono::milliseconds timeout{0};
    const CancellationToken* cancel = nullptr;
};

} // namespace adpush::upload
