#include "safety/loop_guard.hpp"
#include "core/utils.hpp"
#include <format>

namespace unidb {

LoopGuard::LoopGuard(std::string name, uint64_t max_iterations)
    : name_(std::move(name)),
      max_iterations_(max_iterations),
      start_(std::chrono::steady_clock::now()) {}

bool LoopGuard::check_iteration() {
    const uint64_t current = iterations_.fetch_add(1, std::memory_order_relaxed) + 1;

    if (current > max_iterations_) {
        if (!limit_logged_.exchange(true, std::memory_order_relaxed)) {
            utils::log::error(std::format("Loop '{}' exceeded maximum iterations ({})",
                name_, max_iterations_));
        }
        return false;
    }

    if (!slow_warning_emitted_.load(std::memory_order_relaxed) &&
        std::chrono::steady_clock::now() - start_ > kSlowLoopThreshold &&
        !slow_warning_emitted_.exchange(true, std::memory_order_relaxed)) {
        utils::log::warn(std::format("Loop '{}' still running after {}ms ({} iterations)",
            name_, elapsed().count(), current));
    }

    return true;
}

std::chrono::milliseconds LoopGuard::elapsed() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_);
}

} // namespace unidb
