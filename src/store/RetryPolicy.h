#pragma once

#include <algorithm>
#include <chrono>

namespace livestate::store {

// Bounded exponential backoff for transient store failures.
struct RetryPolicy {
    int attempts = 3;
    std::chrono::milliseconds base_delay{50};
    std::chrono::milliseconds max_delay{1000};

    // Delay before attempt `attempt` (1-based; the first attempt has none).
    std::chrono::milliseconds delay_before(int attempt) const noexcept {
        if (attempt <= 1) return std::chrono::milliseconds{0};
        auto delay = base_delay;
        for (int i = 2; i < attempt && delay < max_delay; ++i) delay *= 2;
        return std::min(delay, max_delay);
    }
};

} // namespace livestate::store
