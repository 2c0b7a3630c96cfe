#include "safety/retry_policy.hpp"
#include <algorithm>

namespace unidb {

RetryPolicy RetryPolicy::fixed(std::chrono::milliseconds interval) {
    RetryPolicy policy;
    policy.backoff = Backoff::FIXED;
    policy.initial_delay = interval;
    policy.max_delay = std::max(interval, policy.max_delay);
    return policy;
}

RetryPolicy RetryPolicy::exponential(std::chrono::milliseconds initial_delay,
                                     double multiplier,
                                     std::chrono::milliseconds max_delay) {
    RetryPolicy policy;
    policy.backoff = Backoff::EXPONENTIAL;
    policy.initial_delay = initial_delay;
    policy.multiplier = multiplier;
    policy.max_delay = max_delay;
    return policy;
}

RetryPolicy RetryPolicy::linear(std::chrono::milliseconds initial_delay,
                                std::chrono::milliseconds increment,
                                std::chrono::milliseconds max_delay) {
    RetryPolicy policy;
    policy.backoff = Backoff::LINEAR;
    policy.initial_delay = initial_delay;
    policy.increment = increment;
    policy.max_delay = max_delay;
    return policy;
}

std::chrono::milliseconds RetryPolicy::delay_for(uint64_t failed_attempts) const {
    if (failed_attempts == 0) return std::chrono::milliseconds(0);
    const uint64_t step = failed_attempts - 1;

    switch (backoff) {
        case Backoff::FIXED:
            return std::min(initial_delay, max_delay);

        case Backoff::EXPONENTIAL: {
            // Multiply step by step so a large attempt count saturates at the cap
            double delay = static_cast<double>(initial_delay.count());
            const double cap = static_cast<double>(max_delay.count());
            for (uint64_t i = 0; i < step && delay < cap; ++i) {
                delay *= multiplier;
            }
            return std::chrono::milliseconds(static_cast<int64_t>(std::min(delay, cap)));
        }

        case Backoff::LINEAR: {
            const auto remaining = max_delay - initial_delay;
            if (increment.count() <= 0 || remaining.count() <= 0) {
                return std::min(initial_delay, max_delay);
            }
            const auto max_steps = static_cast<uint64_t>(remaining.count() / increment.count());
            if (step > max_steps) return max_delay;
            return initial_delay + increment * static_cast<int64_t>(step);
        }
    }
    return initial_delay;
}

} // namespace unidb
