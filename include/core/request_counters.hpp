#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

namespace unidb {

/**
 * @brief Process-wide request counters
 *
 * initialize() is called once at startup (DatabaseService does it); the
 * counters are never reset afterwards and are read only through accessors.
 * All members are lock-free atomics.
 */
class RequestCounters {
public:
    /**
     * @brief Record process start. Idempotent: later calls are no-ops.
     */
    static void initialize();

    [[nodiscard]] static bool is_initialized();

    /**
     * @brief Allocate a unique request id ("req-<start_ms>-<sequence>")
     */
    [[nodiscard]] static std::string next_request_id();

    static void record_operation(bool success);
    static void record_engine_switch();

    [[nodiscard]] static uint64_t total_operations();
    [[nodiscard]] static uint64_t failed_operations();

    // Incremented on every active-engine switch
    [[nodiscard]] static uint64_t engine_generation();

    [[nodiscard]] static std::chrono::milliseconds uptime();

private:
    static std::atomic<bool> initialized_;
    static std::atomic<int64_t> start_ms_;
    static std::atomic<uint64_t> request_sequence_;
    static std::atomic<uint64_t> total_operations_;
    static std::atomic<uint64_t> failed_operations_;
    static std::atomic<uint64_t> engine_generation_;
};

} // namespace unidb
