#include "adpush/core/cancellation.hpp"

namespace adpush {

void CancellationToken::cancel() {
    {
        std::lock_guard lock(mutex_);
        cancelled_.store(true, std::memory_order_release);
    }
    cv_.notify_all();
}

bool CancellationToken::wait_for(std::chrono::milliseconds duration) const {
    if (duration.count() <= 0) {
        return is_cancelled();
    }
    std::unique_lock lock(mutex_);
    return cv_.wait_for(lock, duration, [this] {
        return cancelled_.load(std::memory_order_acquire);
    });
}

} // namespace adpush
