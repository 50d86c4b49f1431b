#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace cxfer {

/**
 * @brief Cooperative cancellation signal shared by a job and its helpers
 *
 * THREAD SAFETY:
 * - cancel() may be called from any thread
 * - sleep_for() wakes up immediately once cancel() is called
 */
class CancellationToken {
public:
    CancellationToken() = default;

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel() {
        {
            std::lock_guard lock(mutex_);
            cancelled_ = true;
        }
        cv_.notify_all();
    }

    [[nodiscard]] bool cancelled() const {
        std::lock_guard lock(mutex_);
        return cancelled_;
    }

    /**
     * @brief Wait for the given duration unless cancelled first
     *
     * RETURNS: true if the full duration elapsed, false if cancelled
     */
    template<typename Rep, typename Period>
    bool sleep_for(std::chrono::duration<Rep, Period> duration) const {
        std::unique_lock lock(mutex_);
        if (duration <= duration.zero()) {
            return !cancelled_;
        }
        return !cv_.wait_for(lock, duration, [this] { return cancelled_; });
    }

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    bool cancelled_ = false;
};

} // namespace cxfer
