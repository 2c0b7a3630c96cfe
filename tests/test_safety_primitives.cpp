#include <catch2/catch_test_macros.hpp>
#include "safety/loop_guard.hpp"
#include "safety/resource_monitor.hpp"
#include <thread>
#include <vector>

using namespace unidb;

TEST_CASE("LoopGuard: allows exactly max iterations", "[loop_guard]") {
    LoopGuard guard("bounded", 5);

    for (int i = 1; i <= 5; ++i) {
        CHECK(guard.check_iteration());
    }
    CHECK_FALSE(guard.check_iteration());
    CHECK_FALSE(guard.check_iteration());
    CHECK(guard.max_iterations() == 5);
}

TEST_CASE("LoopGuard: counts iterations", "[loop_guard]") {
    LoopGuard guard("counter", 10);

    CHECK(guard.current_iterations() == 0);
    (void)guard.check_iteration();
    (void)guard.check_iteration();
    (void)guard.check_iteration();
    CHECK(guard.current_iterations() == 3);
    CHECK(guard.name() == "counter");
}

TEST_CASE("LoopGuard: zero max rejects the first iteration", "[loop_guard]") {
    LoopGuard guard("never", 0);
    CHECK_FALSE(guard.check_iteration());
}

TEST_CASE("ResourceMonitor: never exceeds the ceiling", "[resource_monitor]") {
    ResourceMonitor monitor(2);

    CHECK(monitor.increment_connections());
    CHECK(monitor.increment_connections());
    CHECK_FALSE(monitor.increment_connections());
    CHECK(monitor.current_connections() == 2);

    monitor.decrement_connections();
    CHECK(monitor.current_connections() == 1);
    CHECK(monitor.increment_connections());
}

TEST_CASE("ResourceMonitor: concurrent reservations stay bounded", "[resource_monitor]") {
    ResourceMonitor monitor(4);
    std::atomic<int> granted{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 16; ++i) {
        threads.emplace_back([&]() {
            if (monitor.increment_connections()) granted.fetch_add(1);
        });
    }
    for (auto& t : threads) t.join();

    CHECK(granted.load() == 4);
    CHECK(monitor.current_connections() == 4);
}

TEST_CASE("ResourceMonitor: ResourceSlot releases on scope exit", "[resource_monitor]") {
    ResourceMonitor monitor(1);
    {
        ResourceSlot first(monitor);
        CHECK(static_cast<bool>(first));
        ResourceSlot second(monitor);
        CHECK_FALSE(static_cast<bool>(second));
        CHECK(monitor.current_connections() == 1);
    }
    CHECK(monitor.current_connections() == 0);
}

TEST_CASE("ResourceMonitor: emergency shutdown records its reason", "[resource_monitor]") {
    ResourceMonitor monitor;

    CHECK_FALSE(monitor.is_emergency_shutdown());
    monitor.trigger_emergency_shutdown("disk full");
    CHECK(monitor.is_emergency_shutdown());
    CHECK(monitor.emergency_reason() == "disk full");

    monitor.reset_emergency_shutdown();
    CHECK_FALSE(monitor.is_emergency_shutdown());
}
