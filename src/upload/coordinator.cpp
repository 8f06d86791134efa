#include "adpush/upload/coordinator.hpp"

#include "adpush/events/events.hpp"
#include "adpush/upload/retry_policy.hpp"
#include "adpush/upload/session.hpp"

#include <spdlog/spdlog.h>

#include <optional>

namespace adpush::upload {
namespace {

using std::chrono::milliseconds;

/**
 * State of one upload() invocation. Lives on the caller's stack; nothing in
 * it is shared with other uploads.
 */
class UploadRun {
public:
    UploadRun(TransferClient& client, events::EventBus* bus, ByteRangeReader& reader,
              std::uint64_t total_size, const UploadConfig& config,
              const CancellationToken& cancel, ChunkRetryPolicy& policy, std::uint32_t session_attempt)
        : client_(client), bus_(bus), reader_(reader), config_(config), cancel_(cancel)
        , policy_(policy), session_(total_size), session_attempt_(session_attempt)
        , started_at_(std::chrono::steady_clock::now()) {}

    Result<AssetId, UploadError> run() {
        if (cancel_.is_cancelled()) {
            return cancelled();
        }

        if (auto res = start(); res.is_error()) {
            return res.forward_error<AssetId>();
        }

        const auto chunk_timeout = config_.effective_chunk_timeout();
        while (auto chunk = session_.next_chunk(config_.chunk_size)) {
            if (cancel_.is_cancelled()) {
                return cancelled();
            }
            auto res = push(*chunk, chunk_timeout);
            if (res.is_error()) {
                return res.forward_error<AssetId>();
            }
            if (session_.state() == SessionState::Completed) {
                return completed();
            }
        }

        if (cancel_.is_cancelled()) {
            return cancelled();
        }
        return finish();
    }

    [[nodiscard]] const std::string& session_id() const noexcept { return session_.session_id(); }

private:
    using Failure = Result<void, UploadError>;

    Failure start() {
        RetryState retry;
        while (true) {
            ++retry.attempts;
            auto res = client_.start(session_.total_size(), CallOptions{config_.connect_timeout, &cancel_});
            if (res.is_ok()) {
                if (auto applied = session_.on_started(res.value()); applied.is_error()) {
                    return fail(applied.error(), retry.attempts);
                }
                spdlog::debug("Session {} started at offset {} for {} bytes",
                              session_.session_id(), session_.committed_offset(), session_.total_size());
                emit(events::UploadStartedEvent{session_.session_id(), session_.total_size(),
                                                session_.committed_offset(), session_attempt_});
                return Ok();
            }
            if (auto waited = handle_failure(res.error(), retry, 0, "start"); waited.is_error()) {
                return waited;
            }
        }
    }

    /// Pushes one chunk until the remote acknowledges progress or the attempt budget is spent
    Failure push(const ChunkRequest& chunk, milliseconds timeout) {
        auto bytes = reader_.read(chunk.start_offset, chunk.end_offset);
        if (bytes.is_error()) {
            return fail(bytes.error(), 0);
        }

        RetryState retry;
        while (true) {
            if (auto paused = honor_throttle(); paused.is_error()) {
                return paused;
            }
            if (cancel_.is_cancelled()) {
                return cancelled_failure();
            }

            ++retry.attempts;
            spdlog::trace("Pushing [{}, {}) of session {} (attempt {})",
                          chunk.start_offset, chunk.end_offset, chunk.session_id, retry.attempts);
            auto res = client_.push_chunk(chunk, bytes.value(), CallOptions{timeout, &cancel_});
            if (res.is_error()) {
                if (auto waited = handle_failure(res.error(), retry, chunk.start_offset, "chunk");
                    waited.is_error()) {
                    return waited;
                }
                continue;
            }

            pending_throttle_ = res.value().throttle;
            const auto from = session_.committed_offset();
            auto outcome = session_.on_chunk_acknowledged(chunk, res.value());
            if (outcome.is_error()) {
                return fail(outcome.error(), retry.attempts);
            }

            switch (outcome.value()) {
                case AckOutcome::NoProgress: {
                    auto error = make_error(ErrorKind::Transient,
                        "Remote accepted no bytes at offset " + std::to_string(chunk.start_offset));
                    if (auto waited = handle_failure(error, retry, chunk.start_offset, "chunk");
                        waited.is_error()) {
                        return waited;
                    }
                    continue;
                }
                case AckOutcome::Rewound:
                    emit(events::OffsetRewoundEvent{session_.session_id(), from, session_.committed_offset()});
                    if (session_.info().rewinds > config_.max_offset_rewinds) {
                        return fail(make_error(ErrorKind::PermanentRejection,
                            "Remote rewound the session " + std::to_string(session_.info().rewinds) +
                            " times"), retry.attempts);
                    }
                    return Ok();
                case AckOutcome::Advanced:
                case AckOutcome::ReadyToFinish:
                case AckOutcome::Completed:
                    emit(events::ChunkAcknowledgedEvent{session_.session_id(), chunk.start_offset,
                                                        chunk.size(), session_.committed_offset(),
                                                        session_.total_size(), retry.attempts});
                    return Ok();
            }
        }
    }

    Result<AssetId, UploadError> finish() {
        if (auto res = session_.begin_finishing(); res.is_error()) {
            return fail(res.error(), 0).forward_error<AssetId>();
        }

        RetryState retry;
        while (true) {
            if (auto paused = honor_throttle(); paused.is_error()) {
                return paused.forward_error<AssetId>();
            }
            if (cancel_.is_cancelled()) {
                return cancelled();
            }

            ++retry.attempts;
            auto res = client_.finish(session_.session_id(), CallOptions{config_.connect_timeout, &cancel_});
            if (res.is_ok()) {
                if (auto applied = session_.on_finished(res.value()); applied.is_error()) {
                    return fail(applied.error(), retry.attempts).forward_error<AssetId>();
                }
                return completed();
            }
            if (auto waited = handle_failure(res.error(), retry, session_.committed_offset(), "finish");
                waited.is_error()) {
                return waited.forward_error<AssetId>();
            }
        }
    }

    /**
     * Consults the retry policy for a failed call. Returns Ok after the
     * backoff wait when the call should be repeated, or the terminal failure.
     */
    Failure handle_failure(UploadError error, RetryState& retry, std::uint64_t offset, const char* phase) {
        if (error.kind == ErrorKind::Cancelled) {
            return cancelled_failure();
        }

        const auto decision = policy_.decide(error, retry);
        switch (decision.action) {
            case RetryAction::RetryAfterDelay:
                emit(events::ChunkRetryScheduledEvent{session_.session_id(), offset, retry.attempts,
                                                      decision.delay, error.describe()});
                spdlog::debug("{} at offset {} failed ({}), retrying in {}ms",
                              phase, offset, error.message, decision.delay.count());
                if (cancel_.wait_for(decision.delay)) {
                    return cancelled_failure();
                }
                retry.elapsed_backoff += decision.delay;
                return Ok();

            case RetryAction::Exhausted: {
                auto exhausted = make_error(ErrorKind::ChunkExhausted,
                    std::string(phase) + " at offset " + std::to_string(offset) + " failed " +
                    std::to_string(retry.attempts) + " times: " + error.message,
                    error.transport_detail, error.http_status);
                exhausted.retry_after = error.retry_after;
                return fail(std::move(exhausted), retry.attempts);
            }

            case RetryAction::FailSession:
            case RetryAction::FailImmediately:
                break;
        }
        return fail(std::move(error), retry.attempts);
    }

    Failure honor_throttle() {
        if (!pending_throttle_) {
            return Ok();
        }
        const auto pause = *pending_throttle_;
        pending_throttle_.reset();
        emit(events::RateLimitPauseEvent{session_.session_id(), pause});
        if (cancel_.wait_for(pause)) {
            return cancelled_failure();
        }
        return Ok();
    }

    Failure fail(UploadError error, std::uint32_t attempts) {
        error.attempts = attempts;
        session_.mark_failed(error);
        error.committed_offset = session_.committed_offset();
        return Err<void>(std::move(error));
    }

    Failure cancelled_failure() {
        session_.mark_cancelled();
        emit(events::UploadCancelledEvent{session_.session_id(), session_.committed_offset()});
        auto error = make_error(ErrorKind::Cancelled, "Upload cancelled by caller");
        error.committed_offset = session_.committed_offset();
        return Err<void>(std::move(error));
    }

    Result<AssetId, UploadError> cancelled() {
        return cancelled_failure().forward_error<AssetId>();
    }

    Result<AssetId, UploadError> completed() {
        const auto elapsed = std::chrono::duration_cast<milliseconds>(
            std::chrono::steady_clock::now() - started_at_);
        emit(events::UploadCompletedEvent{session_.session_id(), session_.info().asset_id,
                                          session_.total_size(), elapsed});
        return Ok(session_.info().asset_id);
    }

    template<typename EventType>
    void emit(const EventType& event) {
        if (bus_) {
            bus_->emit(event);
        }
    }

    TransferClient& client_;
    events::EventBus* bus_;
    ByteRangeReader& reader_;
    const UploadConfig& config_;
    const CancellationToken& cancel_;
    ChunkRetryPolicy& policy_;
    UploadSession session_;
    std::uint32_t session_attempt_;
    std::chrono::steady_clock::time_point started_at_;
    std::optional<milliseconds> pending_throttle_;
};

} // namespace

UploadCoordinator::UploadCoordinator(TransferClient& client, events::EventBus* bus)
    : client_(client), bus_(bus) {}

Result<AssetId, UploadError> UploadCoordinator::upload(ByteRangeReader& reader,
                                                       std::uint64_t total_size,
                                                       const UploadConfig& config,
                                                       const CancellationToken& cancel) const {
    if (auto valid = config.validate(); valid.is_error()) {
        return valid.forward_error<AssetId>();
    }
    if (total_size > reader.size()) {
        return Err<AssetId>(make_error(ErrorKind::IOError,
            "Declared size " + std::to_string(total_size) + " exceeds file size " +
            std::to_string(reader.size())));
    }

    ChunkRetryPolicy policy(config.retry_settings(), config.retry_seed);

    for (std::uint32_t session_attempt = 1;; ++session_attempt) {
        UploadRun run(client_, bus_, reader, total_size, config, cancel, policy, session_attempt);
        auto result = run.run();
        if (result.is_ok() || result.error().kind == ErrorKind::Cancelled) {
            return result;
        }
        // Only the outcome of the whole upload counts as a failure
        if (result.error().kind != ErrorKind::SessionExpired ||
            session_attempt > config.max_session_restarts) {
            if (bus_) {
                bus_->emit(events::UploadFailedEvent{run.session_id(), result.error()});
            }
            return result;
        }
        spdlog::warn("Upload session expired at offset {}; starting a new session ({}/{})",
                     result.error().committed_offset, session_attempt, config.max_session_restarts);
    }
}

Result<AssetId, UploadError> UploadCoordinator::upload(ByteRangeReader& reader,
                                                       std::uint64_t total_size,
                                                       const UploadConfig& config) const {
    CancellationToken never_cancelled;
    return upload(reader, total_size, config, never_cancelled);
}

Result<AssetId, UploadError> UploadCoordinator::upload_file(const std::filesystem::path& path,
                                                            const UploadConfig& config,
                                                            const CancellationToken& cancel) const {
    auto reader = ByteRangeReader::open(path);
    if (reader.is_error()) {
        return reader.forward_error<AssetId>();
    }
    return upload(reader.value(), reader.value().size(), config, cancel);
}

} // namespace adpush::upload
