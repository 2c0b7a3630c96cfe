#pragma once

#include "core/error.hpp"
#include "core/request_counters.hpp"
#include "core/utils.hpp"
#include "safety/circuit_breaker.hpp"
#include "safety/loop_guard.hpp"
#include "safety/resource_monitor.hpp"
#include "safety/retry_policy.hpp"
#include "safety/timeout_config.hpp"

#include <chrono>
#include <exception>
#include <format>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>
#include <utility>

namespace unidb {

/**
 * @brief Whether an error outcome counts against the circuit breaker
 *
 * Backend failures and timeouts count. Rejections made by the safety layer
 * itself, and contract violations detected before any I/O, do not.
 */
[[nodiscard]] bool counts_as_breaker_failure(ErrorCode code);

/**
 * @brief Whether safe_retry may try an operation again after this error
 */
[[nodiscard]] bool is_retryable(ErrorCode code);

template<typename R>
struct is_result : std::false_type {};

template<typename T>
struct is_result<Result<T>> : std::true_type {};

namespace detail {

/**
 * @brief Run op on a worker thread and wait at most budget for it
 *
 * On timeout the worker is abandoned, not cancelled: it keeps the callable
 * (and everything it captured) alive until it finishes, so op must own what
 * it touches. The caller gets TIMEOUT immediately.
 */
template<typename Op>
auto run_with_deadline(Op&& op, std::chrono::milliseconds budget, std::string_view name)
    -> std::invoke_result_t<std::decay_t<Op>&> {
    using R = std::invoke_result_t<std::decay_t<Op>&>;

    auto task = std::make_shared<std::packaged_task<R()>>(
        [fn = std::forward<Op>(op)]() mutable -> R {
            try {
                return fn();
            } catch (const std::exception& e) {
                return R::error(ErrorCode::OPERATION_FAILED,
                    std::format("unhandled exception: {}", e.what()));
            } catch (...) {
                return R::error(ErrorCode::OPERATION_FAILED,
                    "unhandled exception: unknown exception type");
            }
        });
    auto future = task->get_future();
    std::thread([task]() { (*task)(); }).detach();

    if (future.wait_for(budget) == std::future_status::timeout) {
        utils::log::warn(std::format("Operation '{}' timed out after {}ms",
            name, budget.count()));
        return R::error(ErrorCode::TIMEOUT,
            std::format("operation '{}' timed out after {}ms", name, budget.count()));
    }
    return future.get();
}

} // namespace detail

/**
 * @brief Resilience front door for every pool and connection operation
 *
 * safe_execute order: emergency shutdown, circuit breaker, resource slot,
 * deadline, breaker bookkeeping. Operations are callables returning
 * Result<T>; the result type is deduced from them.
 */
class SafetyManager {
public:
    struct Config {
        TimeoutConfig timeouts;
        CircuitBreaker::Config breaker;
        RetryPolicy retry;
        size_t max_active_operations = 100;
    };

    explicit SafetyManager(std::string name = "default");
    SafetyManager(std::string name, const Config& config);

    /**
     * @brief Run op through every safety check
     * @param budget Overrides the default timeout (e.g. query_timeout)
     */
    template<typename Op>
    auto safe_execute(Op&& op, std::string_view operation_name,
                      std::optional<std::chrono::milliseconds> budget = std::nullopt)
        -> std::invoke_result_t<std::decay_t<Op>&> {
        using R = std::invoke_result_t<std::decay_t<Op>&>;
        static_assert(is_result<R>::value, "safe_execute operations must return Result<T>");

        if (monitor_->is_emergency_shutdown()) {
            return R::error(ErrorCode::EMERGENCY_SHUTDOWN,
                std::format("emergency shutdown active: {}", monitor_->emergency_reason()));
        }

        if (!breaker_->can_execute()) {
            return R::error(ErrorCode::CIRCUIT_OPEN,
                std::format("circuit breaker '{}' is open", breaker_->name()));
        }

        // The worker owns the slot: a timed-out call keeps counting until it returns
        auto slot = std::make_shared<ResourceSlot>(*monitor_);
        if (!*slot) {
            return R::error(ErrorCode::RESOURCE_LIMIT_EXCEEDED,
                std::format("active operation limit ({}) reached", monitor_->max_connections()));
        }

        auto result = detail::run_with_deadline(
            [slot = std::move(slot), fn = std::forward<Op>(op)]() mutable -> R {
                auto held = std::move(slot);
                return fn();
            },
            budget.value_or(config_.timeouts.default_timeout), operation_name);

        if (result.is_ok()) {
            breaker_->record_success();
        } else if (counts_as_breaker_failure(result.error_code())) {
            breaker_->record_failure();
        }
        RequestCounters::record_operation(result.is_ok());
        return result;
    }

    /**
     * @brief Pool-only wrapper: pool timeout, no breaker, no resource slot
     */
    template<typename Op>
    auto safe_pool_operation(Op&& op, std::string_view operation_name)
        -> std::invoke_result_t<std::decay_t<Op>&> {
        auto result = detail::run_with_deadline(std::forward<Op>(op),
            config_.timeouts.pool_timeout, operation_name);
        if (result.is_error() && result.error_code() != ErrorCode::TIMEOUT) {
            utils::log::warn(std::format("Pool operation '{}' failed: {}",
                operation_name, result.error_message()));
        }
        return result;
    }

    /**
     * @brief Retry op under a LoopGuard of max_attempts iterations
     *
     * Stops on success, on a non-retryable error, or once more than half of
     * the attempts have failed (that error is returned). Sleeps between
     * attempts as the policy (default: Config::retry) schedules.
     */
    template<typename Op>
    auto safe_retry(const std::string& loop_name, uint64_t max_attempts, Op&& op,
                    std::optional<RetryPolicy> policy = std::nullopt)
        -> std::invoke_result_t<std::decay_t<Op>&> {
        using R = std::invoke_result_t<std::decay_t<Op>&>;
        const RetryPolicy& schedule = policy ? *policy : config_.retry;
        LoopGuard guard(loop_name, max_attempts);

        while (true) {
            if (!guard.check_iteration()) {
                return R::error(ErrorCode::OPERATION_FAILED,
                    std::format("loop limit exceeded in {}", loop_name));
            }
            auto result = op();
            if (result.is_ok() || !is_retryable(result.error_code()) ||
                guard.current_iterations() > max_attempts / 2) {
                return result;
            }
            const auto delay = schedule.delay_for(guard.current_iterations());
            utils::log::debug(std::format("{}: attempt {} failed ({}), retrying in {}ms",
                loop_name, guard.current_iterations(), result.error_message(), delay.count()));
            std::this_thread::sleep_for(delay);
        }
    }

    const TimeoutConfig& timeouts() const { return config_.timeouts; }
    const std::shared_ptr<CircuitBreaker>& circuit_breaker() const { return breaker_; }
    const std::shared_ptr<ResourceMonitor>& resource_monitor() const { return monitor_; }

    void trigger_emergency_shutdown(const std::string& reason) {
        monitor_->trigger_emergency_shutdown(reason);
    }
    void reset_emergency_shutdown() { monitor_->reset_emergency_shutdown(); }

private:
    Config config_;
    std::shared_ptr<CircuitBreaker> breaker_;
    std::shared_ptr<ResourceMonitor> monitor_;
};

} // namespace unidb
