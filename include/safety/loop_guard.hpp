#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

namespace unidb {

/**
 * @brief Bounds the iteration count of a retry or polling loop
 *
 * check_iteration() returns true for iterations 1..max_iterations and false
 * from then on. A loop still running after kSlowLoopThreshold logs one
 * warning.
 */
class LoopGuard {
public:
    static constexpr std::chrono::seconds kSlowLoopThreshold{10};

    LoopGuard(std::string name, uint64_t max_iterations);

    [[nodiscard]] bool check_iteration();

    [[nodiscard]] uint64_t current_iterations() const {
        return iterations_.load(std::memory_order_relaxed);
    }
    [[nodiscard]] uint64_t max_iterations() const { return max_iterations_; }
    [[nodiscard]] std::chrono::milliseconds elapsed() const;
    const std::string& name() const { return name_; }

private:
    std::string name_;
    uint64_t max_iterations_;
    std::atomic<uint64_t> iterations_{0};
    std::atomic<bool> slow_warning_emitted_{false};
    std::atomic<bool> limit_logged_{false};
    std::chrono::steady_clock::time_point start_;
};

} // namespace unidb
