#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace http_notifier {

/**
 * Cooperative cancellation for a retry run.
 * Cancelling wakes a pending waitFor() immediately; an in-flight transfer is left alone.
 */
class CancellationToken {
public:
    CancellationToken() = default;

    // non-copyable
    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled_ = true;
        }
        cv_.notify_all();
    }

    bool isCancelled() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cancelled_;
    }

    // Block for `seconds`. Returns false if cancelled before the time elapsed.
    // Waits too long to represent as a deadline last until cancel().
    bool waitFor(double seconds) {
        using clock = std::chrono::steady_clock;

        std::unique_lock<std::mutex> lock(mutex_);
        auto cancelled = [&]() { return cancelled_; };
        if (!(seconds > 0))
            return !cancelled_;

        const auto now = clock::now();
        const double headroom = std::chrono::duration<double>(clock::time_point::max() - now).count();
        if (seconds >= headroom / 2) {
            cv_.wait(lock, cancelled);
            return false;
        }

        const auto deadline = now + std::chrono::duration_cast<clock::duration>(std::chrono::duration<double>(seconds));
        return !cv_.wait_until(lock, deadline, cancelled);
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool cancelled_ = false;
};

} // namespace http_notifier
