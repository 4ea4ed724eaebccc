#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

// Cooperative cancellation flag shared between a caller and a running job.
// Waits are condition-variable suspensions so a cancel wakes them at once.
class CancellationToken {
public:
    void cancel();
    bool cancelled() const { return cancelled_.load(); }

    // Returns true when the full delay elapsed, false if cancelled before.
    bool wait_for(std::chrono::milliseconds delay) const;

private:
    std::atomic<bool> cancelled_{false};
    mutable std::mutex mtx_;
    mutable std::condition_variable cv_;
};
