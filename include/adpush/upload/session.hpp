#pragma once

#include "adpush/core/error.hpp"
#include "adpush/core/result.hpp"
#include "adpush/upload/types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace adpush::upload {

/// How an acknowledged chunk moved the session
enum class AckOutcome {
    Advanced,       // Committed offset moved forward; more data wanted
    ReadyToFinish,  // Remote holds every byte but issued no asset id yet
    Completed,      // Remote returned the asset id
    NoProgress,     // Remote accepted none of the bytes just sent
    Rewound         // Remote asked for bytes it had already acknowledged
};

/**
 * @brief Three-phase protocol state machine for one resumable upload
 *
 * The remote offset is authoritative: every acknowledgement moves
 * committed_offset to the value the remote returned, and the next chunk is
 * always cut from there.
 */
class UploadSession {
public:
    explicit UploadSession(std::uint64_t total_size);

    [[nodiscard]] const std::string& session_id() const noexcept { return info_.session_id; }
    [[nodiscard]] SessionState state() const noexcept { return info_.state; }
    [[nodiscard]] std::uint64_t committed_offset() const noexcept { return info_.committed_offset; }
    [[nodiscard]] std::uint64_t total_size() const noexcept { return info_.total_size; }
    [[nodiscard]] const UploadSessionInfo& info() const noexcept { return info_; }

    Result<void, UploadError> on_started(const StartResponse& response);

    Result<AckOutcome, UploadError> on_chunk_acknowledged(const ChunkRequest& request,
                                                          const ChunkResult& result);

    Result<void, UploadError> begin_finishing();
    Result<void, UploadError> on_finished(const FinishResponse& response);

    Result<void, UploadError> transition_to(SessionState next_state);

    void mark_failed(UploadError error);
    void mark_cancelled();

    /// [committed, min(committed + chunk_size, total)), or nothing once all bytes are committed
    [[nodiscard]] std::optional<ChunkRequest> next_chunk(std::uint64_t chunk_size) const;

    [[nodiscard]] bool is_terminal() const noexcept;

    [[nodiscard]] std::chrono::system_clock::time_point last_transition() const noexcept {
        return last_transition_;
    }

private:
    [[nodiscard]] bool can_transition(SessionState target) const noexcept;

    Result<void, UploadError> complete_with(AssetId asset_id);

    UploadSessionInfo info_;
    std::chrono::system_clock::time_point last_transition_{};
};

} // namespace adpush::upload
