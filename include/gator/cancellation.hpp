#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace gator {

// Job-scoped stop flag. Every blocking wait in the scheduler goes through
// waitFor() so that cancel() wakes it immediately.
class Cancellation {
public:
    void cancel() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled_.store(true, std::memory_order_release);
        }
        cv_.notify_all();
    }

    [[nodiscard]] bool isCancelled() const noexcept {
        return cancelled_.load(std::memory_order_acquire);
    }

    // Returns true when cancelled before the timeout elapsed.
    template <typename Rep, typename Period>
    bool waitFor(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return isCancelled(); });
    }

private:
    std::atomic<bool> cancelled_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
};

} // namespace gator
