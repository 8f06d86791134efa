#pragma once

#include "adpush/core/error.hpp"
#include "adpush/upload/types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <random>

namespace adpush::upload {

struct RetryPolicySettings {
    std::uint32_t max_attempts = 5;
    std::chrono::milliseconds base_delay{500};
    std::chrono::milliseconds max_delay{30000};
    double jitter_ratio = 0.2;      ///< Jitter is uniform in [0, jitter_ratio * delay]
};

enum class RetryAction {
    RetryAfterDelay,   // Transient; try the same request again after delay
    FailSession,       // SessionExpired; no chunk-level retry can help
    FailImmediately,   // PermanentRejection and other non-retryable kinds
    Exhausted          // Transient, but the attempt budget is spent
};

struct RetryDecision {
    RetryAction action = RetryAction::FailImmediately;
    std::chrono::milliseconds delay{0};
};

/**
 * @brief Decides retry, backoff or give-up for a failed remote call
 *
 * Attempt n waits min(base * 2^(n-1), cap) plus jitter, and never less than
 * a retry hint supplied by the server. Not thread-safe; each upload owns one.
 */
class ChunkRetryPolicy {
public:
    /// A fixed seed makes the jitter sequence reproducible
    explicit ChunkRetryPolicy(RetryPolicySettings settings,
                              std::optional<std::uint64_t> seed = std::nullopt);

    /// @param state attempts already made for this request, including the one that failed
    RetryDecision decide(const UploadError& error, const RetryState& state);

    /// Exponential part of the delay for attempt @p attempt (1-based), without jitter
    [[nodiscard]] std::chrono::milliseconds base_backoff(std::uint32_t attempt) const noexcept;

    [[nodiscard]] const RetryPolicySettings& settings() const noexcept { return settings_; }

private:
    RetryPolicySettings settings_;
    std::mt19937_64 rng_;
};

} // namespace adpush::upload
