#include "safety/circuit_breaker.hpp"
#include "core/utils.hpp"
#include <format>

namespace unidb {

namespace {

std::chrono::system_clock::time_point from_rep(int64_t rep) {
    return std::chrono::system_clock::time_point(
        std::chrono::system_clock::duration(rep));
}

} // namespace

CircuitBreaker::CircuitBreaker(std::string name, const Config& config)
    : name_(std::move(name)),
      config_(config) {}

int64_t CircuitBreaker::steady_now_rep() {
    return std::chrono::steady_clock::now().time_since_epoch().count();
}

bool CircuitBreaker::can_execute() {
    switch (state_.load(std::memory_order_acquire)) {
        case CircuitState::CLOSED:
        case CircuitState::HALF_OPEN:
            return true;

        case CircuitState::OPEN: {
            const auto opened = std::chrono::steady_clock::time_point(
                std::chrono::steady_clock::duration(
                    opened_steady_.load(std::memory_order_acquire)));
            const auto elapsed = std::chrono::steady_clock::now() - opened;

            if (elapsed >= config_.recovery_timeout) {
                attempt_reset();
                // A concurrent failure may have re-opened it in between
                return state_.load(std::memory_order_acquire) != CircuitState::OPEN;
            }
            return false;
        }
    }

    return false;
}

void CircuitBreaker::record_success() {
    const CircuitState current_state = state_.load(std::memory_order_acquire);

    if (current_state == CircuitState::HALF_OPEN) {
        const uint64_t successes = success_count_.fetch_add(1, std::memory_order_acq_rel) + 1;
        if (successes >= config_.success_threshold) {
            close_circuit();
        }
    } else if (current_state == CircuitState::CLOSED) {
        // Failures must be consecutive to trip
        failure_count_.store(0, std::memory_order_relaxed);
    }
}

void CircuitBreaker::record_failure() {
    const CircuitState current_state = state_.load(std::memory_order_acquire);

    last_failure_time_.store(
        std::chrono::system_clock::now().time_since_epoch().count(),
        std::memory_order_release);

    if (current_state == CircuitState::HALF_OPEN) {
        trip(CircuitState::HALF_OPEN);
    } else if (current_state == CircuitState::CLOSED) {
        const uint64_t failures = failure_count_.fetch_add(1, std::memory_order_acq_rel) + 1;
        if (failures >= config_.failure_threshold) {
            trip(CircuitState::CLOSED);
        }
    }
}

CircuitState CircuitBreaker::get_state() const {
    return state_.load(std::memory_order_acquire);
}

CircuitBreakerStats CircuitBreaker::get_stats() const {
    CircuitBreakerStats stats;
    stats.state = state_.load(std::memory_order_acquire);
    stats.success_count = success_count_.load(std::memory_order_relaxed);
    stats.failure_count = failure_count_.load(std::memory_order_relaxed);
    stats.transitions_to_open = transitions_to_open_.load(std::memory_order_relaxed);

    if (const auto rep = last_failure_time_.load(std::memory_order_acquire); rep > 0) {
        stats.last_failure = from_rep(rep);
    }
    if (const auto rep = opened_time_.load(std::memory_order_acquire); rep > 0) {
        stats.opened_at = from_rep(rep);
    }
    return stats;
}

void CircuitBreaker::reset() {
    const CircuitState previous = state_.exchange(CircuitState::CLOSED, std::memory_order_acq_rel);
    success_count_.store(0, std::memory_order_relaxed);
    failure_count_.store(0, std::memory_order_relaxed);
    last_failure_time_.store(0, std::memory_order_relaxed);
    opened_time_.store(0, std::memory_order_relaxed);
    opened_steady_.store(0, std::memory_order_relaxed);
    if (previous != CircuitState::CLOSED) {
        emit_transition(previous, CircuitState::CLOSED);
    }
}

void CircuitBreaker::set_on_state_change(std::function<void(const StateChangeEvent&)> cb) {
    std::lock_guard lock(events_mutex_);
    on_state_change_ = std::move(cb);
}

std::vector<StateChangeEvent> CircuitBreaker::get_recent_events() const {
    std::lock_guard lock(events_mutex_);
    return {recent_events_.begin(), recent_events_.end()};
}

void CircuitBreaker::trip(CircuitState from) {
    CircuitState expected = from;
    if (state_.compare_exchange_strong(expected, CircuitState::OPEN,
                                       std::memory_order_acq_rel,
                                       std::memory_order_acquire)) {
        opened_steady_.store(steady_now_rep(), std::memory_order_release);
        opened_time_.store(std::chrono::system_clock::now().time_since_epoch().count(),
                           std::memory_order_release);
        success_count_.store(0, std::memory_order_relaxed);
        transitions_to_open_.fetch_add(1, std::memory_order_relaxed);
        emit_transition(from, CircuitState::OPEN);
    }
}

void CircuitBreaker::attempt_reset() {
    CircuitState expected = CircuitState::OPEN;
    if (state_.compare_exchange_strong(expected, CircuitState::HALF_OPEN,
                                       std::memory_order_acq_rel,
                                       std::memory_order_acquire)) {
        success_count_.store(0, std::memory_order_relaxed);
        failure_count_.store(0, std::memory_order_relaxed);
        emit_transition(CircuitState::OPEN, CircuitState::HALF_OPEN);
    }
}

void CircuitBreaker::close_circuit() {
    CircuitState expected = CircuitState::HALF_OPEN;
    if (state_.compare_exchange_strong(expected, CircuitState::CLOSED,
                                       std::memory_order_acq_rel,
                                       std::memory_order_acquire)) {
        success_count_.store(0, std::memory_order_relaxed);
        failure_count_.store(0, std::memory_order_relaxed);
        emit_transition(CircuitState::HALF_OPEN, CircuitState::CLOSED);
    }
}

void CircuitBreaker::emit_transition(CircuitState from, CircuitState to) {
    StateChangeEvent event{from, to, std::chrono::system_clock::now(), name_};

    const auto message = std::format("Circuit breaker '{}': {} -> {}",
        name_, circuit_state_to_string(from), circuit_state_to_string(to));
    if (to == CircuitState::OPEN) {
        utils::log::warn(message);
    } else {
        utils::log::info(message);
    }

    std::function<void(const StateChangeEvent&)> callback;
    {
        std::lock_guard lock(events_mutex_);
        recent_events_.push_back(event);
        if (recent_events_.size() > kMaxRecentEvents) {
            recent_events_.pop_front();
        }
        callback = on_state_change_;
    }

    if (callback) {
        callback(event);
    }
}

} // namespace unidb
