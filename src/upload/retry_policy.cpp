#include "adpush/upload/retry_policy.hpp"

#include <algorithm>

namespace adpush::upload {

ChunkRetryPolicy::ChunkRetryPolicy(RetryPolicySettings settings, std::optional<std::uint64_t> seed)
    : settings_(settings)
    , rng_(seed ? *seed : std::random_device{}()) {}

std::chrono::milliseconds ChunkRetryPolicy::base_backoff(std::uint32_t attempt) const noexcept {
    if (attempt == 0) {
        return std::chrono::milliseconds(0);
    }

    const auto cap = settings_.max_delay.count();
    auto delay = settings_.base_delay.count();
    for (std::uint32_t i = 1; i < attempt && delay < cap; ++i) {
        delay *= 2;
    }
    return std::chrono::milliseconds(std::min(delay, cap));
}

RetryDecision ChunkRetryPolicy::decide(const UploadError& error, const RetryState& state) {
    RetryDecision decision;

    switch (error.kind) {
        case ErrorKind::Transient:
            break;
        case ErrorKind::SessionExpired:
            decision.action = RetryAction::FailSession;
            return decision;
        default:
            decision.action = RetryAction::FailImmediately;
            return decision;
    }

    if (state.attempts >= settings_.max_attempts) {
        decision.action = RetryAction::Exhausted;
        return decision;
    }

    auto delay = base_backoff(state.attempts);
    if (settings_.jitter_ratio > 0.0 && delay.count() > 0) {
        std::uniform_real_distribution<double> jitter(0.0, settings_.jitter_ratio);
        delay += std::chrono::milliseconds(
            static_cast<std::chrono::milliseconds::rep>(static_cast<double>(delay.count()) * jitter(rng_)));
    }
    if (error.retry_after && *error.retry_after > delay) {
        delay = *error.retry_after;
    }

    decision.action = RetryAction::RetryAfterDelay;
    decision.delay = delay;
    return decision;
}

} // namespace adpush::upload
