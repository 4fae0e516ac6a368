#pragma once
#include <algorithm>
#include <chrono>
#include <cstdint>

// Whether the attempt counter restarts for every reconnect cycle, or the delay
// sequence keeps growing across cycles of one process lifetime.
enum class BackoffReset { PerReconnect, Persistent };

struct ReconnectPolicy {
    bool autoReconnect = true;
    uint32_t maxRetries = 10;
    std::chrono::milliseconds initialDelay{2000};
    std::chrono::milliseconds maxDelay{60000};
    BackoffReset backoffReset = BackoffReset::PerReconnect;

    /// False when a dropped connection must be treated as fatal.
    [[nodiscard]] bool enabled() const { return autoReconnect && maxRetries > 0; }

    /// Delay before attempt `attempt` (1-based): initial * 2^(attempt-1), capped at maxDelay.
    [[nodiscard]] std::chrono::milliseconds delayFor(uint32_t attempt) const {
        auto delay = initialDelay;
        for (uint32_t i = 1; i < attempt && delay < maxDelay; ++i) {
            delay *= 2;
        }
        return std::min(delay, maxDelay);
    }
};
