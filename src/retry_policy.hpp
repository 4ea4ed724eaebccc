#pragma once

#include <algorithm>
#include <chrono>

// Bounded exponential backoff shared by page and image fetches.
struct RetryPolicy {
    int max_attempts = 3;
    std::chrono::milliseconds base_delay{500};
    std::chrono::milliseconds max_delay{8000};

    // Wait before attempt `attempt` (1-based); zero for the first one.
    std::chrono::milliseconds backoff_before(int attempt) const {
        if (attempt <= 1) return std::chrono::milliseconds{0};
        auto delay = base_delay;
        for (int i = 2; i < attempt && delay < max_delay; ++i) delay *= 2;
        return std::min(delay, max_delay);
    }
};
