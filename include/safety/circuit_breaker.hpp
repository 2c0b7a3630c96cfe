#pragma once

#include "core/types.hpp"
#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace unidb {

/**
 * @brief Structured event emitted on circuit breaker state transitions
 */
struct StateChangeEvent {
    CircuitState from;
    CircuitState to;
    std::chrono::system_clock::time_point timestamp;
    std::string breaker_name;
};

/**
 * @brief Circuit breaker guarding one backend
 *
 * Three states:
 * - CLOSED:     Normal operation, all requests pass through
 * - OPEN:       Failing, reject requests immediately
 * - HALF_OPEN:  Probing recovery, requests pass and their outcome decides
 *
 * State transitions:
 * - CLOSED -> OPEN:      failure_threshold consecutive failures
 * - OPEN -> HALF_OPEN:   recovery_timeout elapsed (first can_execute() after it)
 * - HALF_OPEN -> CLOSED: success_threshold consecutive successes
 * - HALF_OPEN -> OPEN:   any failure
 *
 * All state is atomic; transitions use compare-exchange so concurrent
 * callers agree on exactly one transition.
 */
class CircuitBreaker {
public:
    struct Config {
        uint32_t failure_threshold;                  // Consecutive failures to trip OPEN
        uint32_t success_threshold;                  // Successes to close from HALF_OPEN
        std::chrono::milliseconds recovery_timeout;  // Time in OPEN before probing

        Config()
            : failure_threshold(5),
              success_threshold(3),
              recovery_timeout(60000) {}
    };

    explicit CircuitBreaker(std::string name, const Config& config = Config());

    /**
     * @brief Check if a request may proceed
     *
     * In OPEN, returns false until recovery_timeout has elapsed; the first call
     * after that moves the breaker to HALF_OPEN and returns true.
     */
    bool can_execute();

    void record_success();
    void record_failure();

    [[nodiscard]] CircuitState get_state() const;
    [[nodiscard]] CircuitBreakerStats get_stats() const;

    /**
     * @brief Force reset to CLOSED state
     */
    void reset();

    const std::string& name() const { return name_; }
    const Config& config() const { return config_; }

    /**
     * @brief Register callback for state transitions (invoked outside any lock)
     */
    void set_on_state_change(std::function<void(const StateChangeEvent&)> cb);

    /**
     * @brief Recent state change events, oldest first
     */
    [[nodiscard]] std::vector<StateChangeEvent> get_recent_events() const;

private:
    void trip(CircuitState from);
    void attempt_reset();
    void close_circuit();
    void emit_transition(CircuitState from, CircuitState to);

    static int64_t steady_now_rep();

    std::string name_;
    Config config_;

    std::atomic<CircuitState> state_{CircuitState::CLOSED};
    std::atomic<uint64_t> success_count_{0};
    std::atomic<uint64_t> failure_count_{0};

    // steady_clock for elapsed checks, system_clock for reporting
    std::atomic<int64_t> opened_steady_{0};
    std::atomic<int64_t> opened_time_{0};
    std::atomic<int64_t> last_failure_time_{0};

    std::function<void(const StateChangeEvent&)> on_state_change_;
    std::deque<StateChangeEvent> recent_events_;
    mutable std::mutex events_mutex_;
    static constexpr size_t kMaxRecentEvents = 100;
    std::atomic<uint64_t> transitions_to_open_{0};
};

} // namespace unidb
