#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace adpush {

/**
 * @brief Cooperative cancellation signal shared between a caller and one upload
 *
 * The caller keeps the token and calls cancel() from any thread. The engine
 * checks it between chunks, sleeps on it during backoff, and the HTTP client
 * polls it to abort an in-flight request.
 */
class CancellationToken {
public:
    CancellationToken() = default;

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel();

    [[nodiscard]] bool is_cancelled() const noexcept {
        return cancelled_.load(std::memory_order_acquire);
    }

    /**
     * @brief Sleep for up to @p duration, waking early on cancel()
     * @return true if the token was cancelled before or during the wait
     */
    bool wait_for(std::chrono::milliseconds duration) const;

private:
    std::atomic<bool> cancelled_{false};
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
};

} // namespace adpush
