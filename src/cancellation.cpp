#include "cancellation.hpp"

void CancellationToken::cancel() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        cancelled_ = true;
    }
    cv_.notify_all();
}

bool CancellationToken::wait_for(std::chrono::milliseconds delay) const {
    if (delay.count() <= 0) return !cancelled_;
    std::unique_lock<std::mutex> lk(mtx_);
    return !cv_.wait_for(lk, delay, [&]{ return cancelled_.load(); });
}
