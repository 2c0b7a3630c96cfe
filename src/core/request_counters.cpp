#include "core/request_counters.hpp"
#include <format>

namespace unidb {

std::atomic<bool> RequestCounters::initialized_{false};
std::atomic<int64_t> RequestCounters::start_ms_{0};
std::atomic<uint64_t> RequestCounters::request_sequence_{0};
std::atomic<uint64_t> RequestCounters::total_operations_{0};
std::atomic<uint64_t> RequestCounters::failed_operations_{0};
std::atomic<uint64_t> RequestCounters::engine_generation_{0};

namespace {

int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace

void RequestCounters::initialize() {
    bool expected = false;
    if (initialized_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        start_ms_.store(now_ms(), std::memory_order_release);
    }
}

bool RequestCounters::is_initialized() {
    return initialized_.load(std::memory_order_acquire);
}

std::string RequestCounters::next_request_id() {
    const uint64_t seq = request_sequence_.fetch_add(1, std::memory_order_relaxed) + 1;
    return std::format("req-{}-{}", start_ms_.load(std::memory_order_acquire), seq);
}

void RequestCounters::record_operation(bool success) {
    total_operations_.fetch_add(1, std::memory_order_relaxed);
    if (!success) {
        failed_operations_.fetch_add(1, std::memory_order_relaxed);
    }
}

void RequestCounters::record_engine_switch() {
    engine_generation_.fetch_add(1, std::memory_order_relaxed);
}

uint64_t RequestCounters::total_operations() {
    return total_operations_.load(std::memory_order_relaxed);
}

uint64_t RequestCounters::failed_operations() {
    return failed_operations_.load(std::memory_order_relaxed);
}

uint64_t RequestCounters::engine_generation() {
    return engine_generation_.load(std::memory_order_relaxed);
}

std::chrono::milliseconds RequestCounters::uptime() {
    if (!is_initialized()) return std::chrono::milliseconds{0};
    return std::chrono::milliseconds{now_ms() - start_ms_.load(std::memory_order_acquire)};
}

} // namespace unidb
