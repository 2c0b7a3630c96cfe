#include <catch2/catch_test_macros.hpp>
#include "db/connection_pool.hpp"
#include "mocks/mock_engine.hpp"
#include <thread>
#include <vector>

using namespace unidb;
using namespace unidb::testing;

namespace {

std::shared_ptr<ConnectionPool> make_pool(const std::shared_ptr<MockEngine>& engine,
                                          const DatabaseConfig& config) {
    auto pool = ConnectionPool::create(config.name, engine, config);
    REQUIRE(pool.is_ok());
    return pool.value();
}

} // namespace

TEST_CASE("ConnectionPool: pre-warms min_connections", "[pool]") {
    auto engine = std::make_shared<MockEngine>();
    auto pool = make_pool(engine, mock_config("warm", 2, 4));

    const auto stats = pool->get_stats();
    CHECK(stats.total_connections == 2);
    CHECK(stats.idle_connections == 2);
    CHECK(stats.active_connections == 0);
    CHECK(stats.max_connections == 4);
    CHECK(engine->backend()->connects == 2);
}

TEST_CASE("ConnectionPool: rejects invalid sizing", "[pool]") {
    auto engine = std::make_shared<MockEngine>();

    auto zero = ConnectionPool::create("zero", engine, mock_config("zero", 0, 0));
    CHECK(zero.error_code() == ErrorCode::CONFIGURATION_ERROR);

    auto inverted = ConnectionPool::create("inverted", engine, mock_config("inverted", 3, 2));
    CHECK(inverted.error_code() == ErrorCode::CONFIGURATION_ERROR);

    auto no_engine = ConnectionPool::create("none", nullptr, mock_config("none"));
    CHECK(no_engine.error_code() == ErrorCode::CONFIGURATION_ERROR);
}

TEST_CASE("ConnectionPool: failed pre-warm still creates the pool", "[pool]") {
    auto engine = std::make_shared<MockEngine>();
    engine->backend()->fail_connect = true;

    auto pool = make_pool(engine, mock_config("cold", 2, 4));
    CHECK(pool->get_stats().total_connections == 0);
}

TEST_CASE("ConnectionPool: released connections are reused", "[pool]") {
    auto engine = std::make_shared<MockEngine>();
    auto pool = make_pool(engine, mock_config("reuse", 0, 2));

    std::string first_id;
    {
        auto lease = pool->acquire();
        REQUIRE(lease.is_ok());
        first_id = lease.value()->get()->connection_info().id;
        CHECK(pool->get_stats().active_connections == 1);
    }

    auto again = pool->acquire();
    REQUIRE(again.is_ok());
    CHECK(again.value()->get()->connection_info().id == first_id);
    CHECK(engine->backend()->connects == 1);
}

TEST_CASE("ConnectionPool: acquire times out when exhausted", "[pool][timeout]") {
    auto engine = std::make_shared<MockEngine>();
    auto pool = make_pool(engine, mock_config("exhausted", 0, 1));

    auto held = pool->acquire();
    REQUIRE(held.is_ok());

    auto waited = pool->acquire(std::chrono::milliseconds(20));
    CHECK(waited.error_code() == ErrorCode::TIMEOUT);
    CHECK(pool->get_stats().failed_acquires == 1);

    pool->release(std::move(held.value()));
    CHECK(pool->acquire(std::chrono::milliseconds(20)).is_ok());
}

TEST_CASE("ConnectionPool: waiter is served when a lease returns", "[pool]") {
    auto engine = std::make_shared<MockEngine>();
    auto pool = make_pool(engine, mock_config("handoff", 0, 1));

    auto held = pool->acquire();
    REQUIRE(held.is_ok());

    std::thread releaser([lease = std::move(held.value())]() mutable {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        lease.reset();
    });

    auto waited = pool->acquire(std::chrono::milliseconds(2000));
    CHECK(waited.is_ok());
    releaser.join();
    CHECK(engine->backend()->connects == 1);
}

TEST_CASE("ConnectionPool: live connections never exceed max under contention", "[pool][concurrency]") {
    auto engine = std::make_shared<MockEngine>();
    auto pool = make_pool(engine, mock_config("bounded", 0, 3));

    std::atomic<int> succeeded{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 12; ++i) {
        threads.emplace_back([&]() {
            for (int round = 0; round < 5; ++round) {
                auto lease = pool->acquire(std::chrono::milliseconds(5000));
                if (lease.is_error()) continue;
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
                succeeded.fetch_add(1);
            }
        });
    }
    for (auto& t : threads) t.join();

    CHECK(succeeded.load() == 60);
    CHECK(engine->backend()->peak_live <= 3);
    CHECK(pool->get_stats().total_connections <= 3);
    CHECK(pool->get_stats().total_acquires == 60);
    CHECK(pool->get_stats().total_releases == 60);
}

TEST_CASE("ConnectionPool: broken lease is closed, not reused", "[pool]") {
    auto engine = std::make_shared<MockEngine>();
    auto pool = make_pool(engine, mock_config("broken", 0, 2));

    {
        auto lease = pool->acquire();
        REQUIRE(lease.is_ok());
        lease.value()->mark_broken();
        CHECK(lease.value()->is_broken());
    }

    const auto stats = pool->get_stats();
    CHECK(stats.connections_discarded == 1);
    CHECK(stats.total_connections == 0);
    CHECK(stats.idle_connections == 0);
    CHECK(engine->backend()->closes == 1);

    // The permit came back with it
    auto next = pool->acquire(std::chrono::milliseconds(20));
    REQUIRE(next.is_ok());
    CHECK(engine->backend()->connects == 2);
}

TEST_CASE("ConnectionPool: disconnected connection is dropped on return", "[pool]") {
    auto engine = std::make_shared<MockEngine>();
    auto pool = make_pool(engine, mock_config("dropped", 0, 2));

    {
        auto lease = pool->acquire();
        REQUIRE(lease.is_ok());
        lease.value()->get()->close();
        CHECK_FALSE(lease.value()->is_valid());
    }

    CHECK(pool->get_stats().total_connections == 0);
    CHECK(pool->get_stats().connections_discarded == 0);
}

TEST_CASE("ConnectionPool: explicit release empties the lease", "[pool]") {
    auto engine = std::make_shared<MockEngine>();
    auto pool = make_pool(engine, mock_config("explicit", 0, 1));

    auto lease = pool->acquire();
    REQUIRE(lease.is_ok());
    lease.value()->release();
    CHECK(lease.value()->get() == nullptr);
    CHECK(pool->get_stats().idle_connections == 1);

    // A second release is a no-op
    lease.value()->release();
    CHECK(pool->get_stats().total_releases == 1);
}

TEST_CASE("ConnectionPool: connect failure releases the permit", "[pool]") {
    auto engine = std::make_shared<MockEngine>();
    auto pool = make_pool(engine, mock_config("refused", 0, 1));

    engine->backend()->fail_connect = true;
    auto refused = pool->acquire();
    CHECK(refused.error_code() == ErrorCode::CONNECTION_FAILED);
    CHECK(pool->get_stats().failed_acquires == 1);

    engine->backend()->fail_connect = false;
    CHECK(pool->acquire(std::chrono::milliseconds(20)).is_ok());
}

TEST_CASE("ConnectionPool: idle connections past idle_timeout are evicted", "[pool][lifetime]") {
    auto engine = std::make_shared<MockEngine>();
    auto config = mock_config("idle", 2, 4);
    config.pool.idle_timeout = std::chrono::milliseconds(5);
    auto pool = make_pool(engine, config);
    REQUIRE(pool->get_stats().idle_connections == 2);

    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    CHECK(pool->evict_expired() == 2);

    const auto stats = pool->get_stats();
    CHECK(stats.total_connections == 0);
    CHECK(stats.connections_recycled == 2);
    CHECK(engine->backend()->closes == 2);
}

TEST_CASE("ConnectionPool: fresh idle connections survive eviction", "[pool][lifetime]") {
    auto engine = std::make_shared<MockEngine>();
    auto pool = make_pool(engine, mock_config("fresh", 2, 4));

    CHECK(pool->evict_expired() == 0);
    CHECK(pool->get_stats().idle_connections == 2);
}

TEST_CASE("ConnectionPool: connection past max_lifetime is replaced on acquire", "[pool][lifetime]") {
    auto engine = std::make_shared<MockEngine>();
    auto config = mock_config("lifetime", 0, 2);
    config.pool.idle_timeout = std::chrono::milliseconds(0);
    config.pool.max_lifetime = std::chrono::milliseconds(10);
    auto pool = make_pool(engine, config);

    std::string first_id;
    {
        auto lease = pool->acquire();
        REQUIRE(lease.is_ok());
        first_id = lease.value()->get()->connection_info().id;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(30));

    auto lease = pool->acquire();
    REQUIRE(lease.is_ok());
    CHECK(lease.value()->get()->connection_info().id != first_id);
    CHECK(pool->get_stats().connections_recycled == 1);
    CHECK(engine->backend()->connects == 2);
}

TEST_CASE("ConnectionPool: drain stops leasing and closes returns", "[pool]") {
    auto engine = std::make_shared<MockEngine>();
    auto pool = make_pool(engine, mock_config("drain", 1, 2));

    auto outstanding = pool->acquire();
    REQUIRE(outstanding.is_ok());
    (void)pool->acquire();

    pool->drain();
    CHECK(pool->acquire().error_code() == ErrorCode::POOL_ERROR);

    outstanding.value().reset();
    CHECK(pool->get_stats().total_connections == 0);
    CHECK(engine->backend()->live == 0);
}

TEST_CASE("ConnectionPool: lease outliving its pool closes its connection", "[pool]") {
    auto engine = std::make_shared<MockEngine>();
    auto pool = make_pool(engine, mock_config("orphan", 0, 1));

    auto lease = pool->acquire();
    REQUIRE(lease.is_ok());
    pool.reset();

    CHECK(engine->backend()->live == 1);
    lease.value().reset();
    CHECK(engine->backend()->live == 0);
}

TEST_CASE("ConnectionPool: acquire time histogram", "[pool][metrics]") {
    auto engine = std::make_shared<MockEngine>();
    auto pool = make_pool(engine, mock_config("metrics", 1, 2));

    for (int i = 0; i < 3; ++i) {
        auto lease = pool->acquire();
        REQUIRE(lease.is_ok());
    }

    const auto stats = pool->get_stats();
    CHECK(stats.acquire_time_count == 3);
    uint64_t total_in_buckets = 0;
    for (auto b : stats.acquire_time_buckets) total_in_buckets += b;
    CHECK(total_in_buckets == 3);
}

TEST_CASE("ConnectionPool: health reflects engine and occupancy", "[pool][health]") {
    auto engine = std::make_shared<MockEngine>();
    auto pool = make_pool(engine, mock_config("health", 0, 1));

    CHECK(pool->health_check().state == HealthState::HEALTHY);

    {
        auto lease = pool->acquire();
        REQUIRE(lease.is_ok());
        const auto saturated = pool->health_check();
        CHECK(saturated.state == HealthState::DEGRADED);
        CHECK(saturated.connection_count == 1);
    }

    engine->backend()->health = HealthState::CRITICAL;
    CHECK(pool->health_check().state == HealthState::DEGRADED);

    pool->drain();
    CHECK(pool->health_check().state == HealthState::CRITICAL);
}
