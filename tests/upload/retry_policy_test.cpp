#include "adpush/upload/retry_policy.hpp"

#include <gtest/gtest.h>

using namespace adpush;
using namespace adpush::upload;
using std::chrono::milliseconds;

namespace {

RetryPolicySettings no_jitter() {
    RetryPolicySettings settings;
    settings.max_attempts = 5;
    settings.base_delay = milliseconds(100);
    settings.max_delay = milliseconds(1000);
    settings.jitter_ratio = 0.0;
    return settings;
}

RetryState after(std::uint32_t attempts) {
    RetryState state;
    state.attempts = attempts;
    return state;
}

} // namespace

TEST(RetryPolicyTest, BackoffDoublesUpToCap) {
    ChunkRetryPolicy policy(no_jitter());
    EXPECT_EQ(policy.base_backoff(0), milliseconds(0));
    EXPECT_EQ(policy.base_backoff(1), milliseconds(100));
    EXPECT_EQ(policy.base_backoff(2), milliseconds(200));
    EXPECT_EQ(policy.base_backoff(4), milliseconds(800));
    EXPECT_EQ(policy.base_backoff(5), milliseconds(1000));
    EXPECT_EQ(policy.base_backoff(60), milliseconds(1000));
}

TEST(RetryPolicyTest, TransientErrorsRetryUntilBudgetIsSpent) {
    ChunkRetryPolicy policy(no_jitter());
    const auto error = make_error(ErrorKind::Transient, "503");

    for (std::uint32_t attempt = 1; attempt < 5; ++attempt) {
        const auto decision = policy.decide(error, after(attempt));
        EXPECT_EQ(decision.action, RetryAction::RetryAfterDelay) << "attempt " << attempt;
        EXPECT_EQ(decision.delay, policy.base_backoff(attempt));
    }
    EXPECT_EQ(policy.decide(error, after(5)).action, RetryAction::Exhausted);
}

TEST(RetryPolicyTest, NonTransientKindsNeverRetry) {
    ChunkRetryPolicy policy(no_jitter());
    EXPECT_EQ(policy.decide(make_error(ErrorKind::SessionExpired, "expired"), after(1)).action,
              RetryAction::FailSession);
    EXPECT_EQ(policy.decide(make_error(ErrorKind::PermanentRejection, "bad"), after(1)).action,
              RetryAction::FailImmediately);
    EXPECT_EQ(policy.decide(make_error(ErrorKind::IOError, "disk"), after(1)).action,
              RetryAction::FailImmediately);
    EXPECT_EQ(policy.decide(make_error(ErrorKind::Cancelled, "stop"), after(1)).action,
              RetryAction::FailImmediately);
}

TEST(RetryPolicyTest, RetryAfterRaisesTheDelay) {
    ChunkRetryPolicy policy(no_jitter());
    auto error = make_error(ErrorKind::Transient, "429");
    error.retry_after = milliseconds(5000);
    EXPECT_EQ(policy.decide(error, after(1)).delay, milliseconds(5000));

    error.retry_after = milliseconds(10);
    EXPECT_EQ(policy.decide(error, after(2)).delay, milliseconds(200));
}

TEST(RetryPolicyTest, JitterStaysWithinRatio) {
    auto settings = no_jitter();
    settings.jitter_ratio = 0.5;
    ChunkRetryPolicy policy(settings, 42);
    const auto error = make_error(ErrorKind::Transient, "reset");

    for (int i = 0; i < 100; ++i) {
        const auto delay = policy.decide(error, after(3)).delay;
        EXPECT_GE(delay, milliseconds(400));
        EXPECT_LE(delay, milliseconds(600));
    }
}

TEST(RetryPolicyTest, SeededPoliciesAreReproducible) {
    auto settings = no_jitter();
    settings.jitter_ratio = 0.2;
    ChunkRetryPolicy first(settings, 7);
    ChunkRetryPolicy second(settings, 7);
    const auto error = make_error(ErrorKind::Transient, "timeout");

    for (std::uint32_t attempt = 1; attempt < 5; ++attempt) {
        EXPECT_EQ(first.decide(error, after(attempt)).delay, second.decide(error, after(attempt)).delay);
    }
}
