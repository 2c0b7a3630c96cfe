#pragma once

#include <chrono>
#include <cstdint>

namespace unidb {

/**
 * @brief Delay schedule between safe_retry attempts
 *
 * - FIXED:       initial_delay before every retry
 * - EXPONENTIAL: initial_delay, then multiplied by multiplier per retry
 * - LINEAR:      initial_delay, then increment added per retry
 *
 * Every delay is capped at max_delay. Defaults: exponential, 100ms, x2, 30s cap.
 */
struct RetryPolicy {
    enum class Backoff : uint8_t { FIXED, EXPONENTIAL, LINEAR };

    Backoff backoff = Backoff::EXPONENTIAL;
    std::chrono::milliseconds initial_delay{100};
    double multiplier = 2.0;
    std::chrono::milliseconds increment{100};
    std::chrono::milliseconds max_delay{30000};

    [[nodiscard]] static RetryPolicy fixed(std::chrono::milliseconds interval);
    [[nodiscard]] static RetryPolicy exponential(
        std::chrono::milliseconds initial_delay = std::chrono::milliseconds(100),
        double multiplier = 2.0,
        std::chrono::milliseconds max_delay = std::chrono::milliseconds(30000));
    [[nodiscard]] static RetryPolicy linear(std::chrono::milliseconds initial_delay,
                                            std::chrono::milliseconds increment,
                                            std::chrono::milliseconds max_delay =
                                                std::chrono::milliseconds(30000));

    /**
     * @brief Wait before the next attempt
     * @param failed_attempts Attempts made so far (1 = after the first failure)
     */
    [[nodiscard]] std::chrono::milliseconds delay_for(uint64_t failed_attempts) const;
};

} // namespace unidb
