#include <catch2/catch_test_macros.hpp>
#include "safety/safety_manager.hpp"
#include <atomic>
#include <memory>
#include <thread>
#include <vector>

using namespace unidb;

namespace {

SafetyManager::Config small_config() {
    SafetyManager::Config cfg;
    cfg.timeouts.default_timeout = std::chrono::milliseconds(500);
    cfg.timeouts.pool_timeout = std::chrono::milliseconds(100);
    cfg.breaker.failure_threshold = 2;
    cfg.breaker.recovery_timeout = std::chrono::milliseconds(60000);
    cfg.max_active_operations = 4;
    cfg.retry = RetryPolicy::fixed(std::chrono::milliseconds(1));
    return cfg;
}

} // namespace

TEST_CASE("SafetyManager: successful operation passes its value through", "[safety]") {
    SafetyManager safety("pass", small_config());

    auto result = safety.safe_execute([]() { return Result<int>::ok(42); }, "answer");
    REQUIRE(result.is_ok());
    CHECK(result.value() == 42);
    CHECK(safety.resource_monitor()->current_connections() == 0);
}

TEST_CASE("SafetyManager: emergency shutdown rejects without running", "[safety]") {
    SafetyManager safety("shutdown", small_config());
    safety.trigger_emergency_shutdown("maintenance");

    bool ran = false;
    auto result = safety.safe_execute([&ran]() { ran = true; return Result<void>::ok(); }, "op");
    CHECK(result.error_code() == ErrorCode::EMERGENCY_SHUTDOWN);
    CHECK(result.error_message().find("maintenance") != std::string::npos);
    CHECK_FALSE(ran);

    safety.reset_emergency_shutdown();
    CHECK(safety.safe_execute([]() { return Result<void>::ok(); }, "op").is_ok());
}

TEST_CASE("SafetyManager: backend failures open the circuit", "[safety][circuit_breaker]") {
    SafetyManager safety("trip", small_config());

    auto fail = []() { return Result<void>::error(ErrorCode::QUERY_FAILED, "boom"); };
    CHECK(safety.safe_execute(fail, "op").error_code() == ErrorCode::QUERY_FAILED);
    CHECK(safety.safe_execute(fail, "op").error_code() == ErrorCode::QUERY_FAILED);
    CHECK(safety.circuit_breaker()->get_state() == CircuitState::OPEN);

    bool ran = false;
    auto rejected = safety.safe_execute([&ran]() { ran = true; return Result<void>::ok(); }, "op");
    CHECK(rejected.error_code() == ErrorCode::CIRCUIT_OPEN);
    CHECK_FALSE(ran);
}

TEST_CASE("SafetyManager: contract violations do not count against the breaker", "[safety][circuit_breaker]") {
    SafetyManager safety("contract", small_config());

    for (int i = 0; i < 5; ++i) {
        auto r = safety.safe_execute([]() {
            return Result<void>::error(ErrorCode::VALIDATION_ERROR, "bad input");
        }, "op");
        CHECK(r.error_code() == ErrorCode::VALIDATION_ERROR);
    }
    CHECK(safety.circuit_breaker()->get_state() == CircuitState::CLOSED);
}

TEST_CASE("SafetyManager: error classification", "[safety]") {
    CHECK(counts_as_breaker_failure(ErrorCode::CONNECTION_FAILED));
    CHECK(counts_as_breaker_failure(ErrorCode::TIMEOUT));
    CHECK_FALSE(counts_as_breaker_failure(ErrorCode::VALIDATION_ERROR));
    CHECK_FALSE(counts_as_breaker_failure(ErrorCode::UNSUPPORTED_OPERATION));
    CHECK_FALSE(counts_as_breaker_failure(ErrorCode::CIRCUIT_OPEN));

    CHECK(is_retryable(ErrorCode::CONNECTION_FAILED));
    CHECK(is_retryable(ErrorCode::POOL_ERROR));
    CHECK_FALSE(is_retryable(ErrorCode::QUERY_FAILED));
    CHECK_FALSE(is_retryable(ErrorCode::VALIDATION_ERROR));
}

TEST_CASE("SafetyManager: resource limit rejects extra concurrent operations", "[safety]") {
    auto cfg = small_config();
    cfg.max_active_operations = 1;
    SafetyManager safety("limit", cfg);

    std::atomic<bool> started{false};
    std::atomic<bool> release{false};
    std::thread holder([&]() {
        auto r = safety.safe_execute([&]() {
            started = true;
            while (!release) std::this_thread::sleep_for(std::chrono::milliseconds(1));
            return Result<void>::ok();
        }, "holder");
        CHECK(r.is_ok());
    });

    while (!started) std::this_thread::sleep_for(std::chrono::milliseconds(1));
    auto rejected = safety.safe_execute([]() { return Result<void>::ok(); }, "extra");
    CHECK(rejected.error_code() == ErrorCode::RESOURCE_LIMIT_EXCEEDED);

    release = true;
    holder.join();
    CHECK(safety.resource_monitor()->current_connections() == 0);
}

TEST_CASE("SafetyManager: slow operation times out", "[safety][timeout]") {
    SafetyManager safety("slow", small_config());

    auto done = std::make_shared<std::atomic<bool>>(false);
    auto result = safety.safe_execute([done]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        done->store(true);
        return Result<int>::ok(1);
    }, "slow", std::chrono::milliseconds(20));

    CHECK(result.error_code() == ErrorCode::TIMEOUT);
    CHECK(result.error_message().find("slow") != std::string::npos);

    // The abandoned worker still runs to completion
    std::this_thread::sleep_for(std::chrono::milliseconds(400));
    CHECK(done->load());
}

TEST_CASE("SafetyManager: timed-out operation keeps its slot until it returns", "[safety][timeout][resource]") {
    auto cfg = small_config();
    cfg.max_active_operations = 1;
    SafetyManager safety("ceiling", cfg);

    auto running = std::make_shared<std::atomic<int>>(0);
    auto peak = std::make_shared<std::atomic<int>>(0);
    auto slow = [running, peak]() {
        const int now = running->fetch_add(1) + 1;
        int seen = peak->load();
        while (now > seen && !peak->compare_exchange_weak(seen, now)) {}
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        running->fetch_sub(1);
        return Result<void>::ok();
    };

    auto first = safety.safe_execute(slow, "slow", std::chrono::milliseconds(30));
    CHECK(first.error_code() == ErrorCode::TIMEOUT);
    CHECK(safety.resource_monitor()->current_connections() == 1);

    for (int i = 0; i < 3; ++i) {
        auto rejected = safety.safe_execute(slow, "slow", std::chrono::milliseconds(30));
        CHECK(rejected.error_code() == ErrorCode::RESOURCE_LIMIT_EXCEEDED);
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(500));
    CHECK(peak->load() == 1);
    CHECK(safety.resource_monitor()->current_connections() == 0);
    CHECK(safety.safe_execute([]() { return Result<void>::ok(); }, "after").is_ok());
}

TEST_CASE("SafetyManager: exceptions become OPERATION_FAILED", "[safety]") {
    SafetyManager safety("throws", small_config());

    auto result = safety.safe_execute([]() -> Result<int> {
        throw std::runtime_error("driver exploded");
    }, "throws");
    CHECK(result.error_code() == ErrorCode::OPERATION_FAILED);
    CHECK(result.error_message().find("driver exploded") != std::string::npos);
}

TEST_CASE("SafetyManager: non-standard exceptions become OPERATION_FAILED", "[safety]") {
    auto cfg = small_config();
    cfg.breaker.failure_threshold = 1;
    SafetyManager safety("throws-int", cfg);

    auto result = safety.safe_execute([]() -> Result<int> { throw 42; }, "throws");
    CHECK(result.error_code() == ErrorCode::OPERATION_FAILED);
    CHECK(safety.circuit_breaker()->get_state() == CircuitState::OPEN);
    CHECK(safety.resource_monitor()->current_connections() == 0);
}

TEST_CASE("SafetyManager: safe_retry stops on success", "[safety][retry]") {
    SafetyManager safety("retry", small_config());

    int calls = 0;
    auto result = safety.safe_retry("connect", 5, [&calls]() {
        ++calls;
        if (calls < 2) return Result<int>::error(ErrorCode::CONNECTION_FAILED, "refused");
        return Result<int>::ok(calls);
    });
    REQUIRE(result.is_ok());
    CHECK(calls == 2);
}

TEST_CASE("SafetyManager: safe_retry gives up after half the attempts fail", "[safety][retry]") {
    SafetyManager safety("retry", small_config());

    int calls = 0;
    auto result = safety.safe_retry("connect", 4, [&calls]() {
        ++calls;
        return Result<void>::error(ErrorCode::CONNECTION_FAILED, "refused");
    });
    CHECK(result.error_code() == ErrorCode::CONNECTION_FAILED);
    CHECK(calls == 3);
}

TEST_CASE("SafetyManager: safe_retry does not retry non-retryable errors", "[safety][retry]") {
    SafetyManager safety("retry", small_config());

    int calls = 0;
    auto result = safety.safe_retry("query", 5, [&calls]() {
        ++calls;
        return Result<void>::error(ErrorCode::QUERY_FAILED, "syntax error");
    });
    CHECK(result.error_code() == ErrorCode::QUERY_FAILED);
    CHECK(calls == 1);
}

TEST_CASE("SafetyManager: safe_retry with zero attempts reports the loop limit", "[safety][retry]") {
    SafetyManager safety("retry", small_config());

    auto result = safety.safe_retry("never", 0, []() { return Result<void>::ok(); });
    CHECK(result.error_code() == ErrorCode::OPERATION_FAILED);
    CHECK(result.error_message().find("loop limit exceeded") != std::string::npos);
}

TEST_CASE("SafetyManager: safe_retry backs off exponentially", "[safety][retry]") {
    SafetyManager safety("backoff", small_config());
    using Clock = std::chrono::steady_clock;

    std::vector<Clock::time_point> calls;
    auto result = safety.safe_retry("connect", 6, [&calls]() {
        calls.push_back(Clock::now());
        return Result<void>::error(ErrorCode::CONNECTION_FAILED, "refused");
    }, RetryPolicy::exponential(std::chrono::milliseconds(20), 2.0, std::chrono::milliseconds(1000)));

    CHECK(result.error_code() == ErrorCode::CONNECTION_FAILED);
    REQUIRE(calls.size() == 4);
    CHECK(calls[1] - calls[0] >= std::chrono::milliseconds(20));
    CHECK(calls[2] - calls[1] >= std::chrono::milliseconds(40));
    CHECK(calls[3] - calls[2] >= std::chrono::milliseconds(80));
}

TEST_CASE("SafetyManager: safe_retry waits a fixed interval", "[safety][retry]") {
    SafetyManager safety("fixed", small_config());
    using Clock = std::chrono::steady_clock;

    std::vector<Clock::time_point> calls;
    auto result = safety.safe_retry("connect", 4, [&calls]() {
        calls.push_back(Clock::now());
        if (calls.size() < 3) return Result<int>::error(ErrorCode::TIMEOUT, "slow");
        return Result<int>::ok(3);
    }, RetryPolicy::fixed(std::chrono::milliseconds(30)));

    REQUIRE(result.is_ok());
    REQUIRE(calls.size() == 3);
    CHECK(calls[1] - calls[0] >= std::chrono::milliseconds(30));
    CHECK(calls[2] - calls[1] >= std::chrono::milliseconds(30));
}

TEST_CASE("RetryPolicy: delay schedules", "[safety][retry]") {
    using std::chrono::milliseconds;

    const auto exp = RetryPolicy::exponential();
    CHECK(exp.delay_for(1) == milliseconds(100));
    CHECK(exp.delay_for(2) == milliseconds(200));
    CHECK(exp.delay_for(4) == milliseconds(800));
    CHECK(exp.delay_for(20) == milliseconds(30000));
    CHECK(exp.delay_for(1000) == milliseconds(30000));

    const auto lin = RetryPolicy::linear(milliseconds(50), milliseconds(25), milliseconds(120));
    CHECK(lin.delay_for(1) == milliseconds(50));
    CHECK(lin.delay_for(3) == milliseconds(100));
    CHECK(lin.delay_for(4) == milliseconds(120));

    const auto fixed = RetryPolicy::fixed(milliseconds(250));
    CHECK(fixed.delay_for(1) == milliseconds(250));
    CHECK(fixed.delay_for(9) == milliseconds(250));

    CHECK(RetryPolicy{}.backoff == RetryPolicy::Backoff::EXPONENTIAL);
    CHECK(RetryPolicy{}.delay_for(0) == milliseconds(0));
}

TEST_CASE("SafetyManager: safe_pool_operation bypasses the breaker", "[safety][pool]") {
    auto cfg = small_config();
    cfg.breaker.failure_threshold = 1;
    SafetyManager safety("pool", cfg);

    (void)safety.safe_execute([]() {
        return Result<void>::error(ErrorCode::CONNECTION_FAILED, "down");
    }, "op");
    REQUIRE(safety.circuit_breaker()->get_state() == CircuitState::OPEN);

    auto result = safety.safe_pool_operation([]() { return Result<int>::ok(7); }, "pool.acquire");
    REQUIRE(result.is_ok());
    CHECK(result.value() == 7);
}

TEST_CASE("SafetyManager: safe_pool_operation applies the pool timeout", "[safety][pool][timeout]") {
    SafetyManager safety("pool", small_config());

    auto result = safety.safe_pool_operation([]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        return Result<void>::ok();
    }, "pool.acquire");
    CHECK(result.error_code() == ErrorCode::TIMEOUT);

    std::this_thread::sleep_for(std::chrono::milliseconds(400));
}
