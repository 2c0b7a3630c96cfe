#include "safety/resource_monitor.hpp"
#include "core/utils.hpp"
#include <format>

namespace unidb {

ResourceMonitor::ResourceMonitor(size_t max_active_connections)
    : max_(max_active_connections) {}

bool ResourceMonitor::increment_connections() {
    size_t current = current_.load(std::memory_order_acquire);
    while (current < max_) {
        if (current_.compare_exchange_weak(current, current + 1,
                                           std::memory_order_acq_rel,
                                           std::memory_order_acquire)) {
            return true;
        }
    }
    utils::log::warn(std::format("Resource limit reached: {}/{} active operations",
        current, max_));
    return false;
}

void ResourceMonitor::decrement_connections() {
    size_t current = current_.load(std::memory_order_acquire);
    while (current > 0) {
        if (current_.compare_exchange_weak(current, current - 1,
                                           std::memory_order_acq_rel,
                                           std::memory_order_acquire)) {
            return;
        }
    }
}

void ResourceMonitor::trigger_emergency_shutdown(const std::string& reason) {
    {
        std::lock_guard lock(reason_mutex_);
        reason_ = reason;
    }
    emergency_shutdown_.store(true, std::memory_order_release);
    utils::log::error(std::format("EMERGENCY SHUTDOWN triggered: {}", reason));
}

void ResourceMonitor::reset_emergency_shutdown() {
    emergency_shutdown_.store(false, std::memory_order_release);
    {
        std::lock_guard lock(reason_mutex_);
        reason_.clear();
    }
    utils::log::info("Emergency shutdown cleared");
}

std::string ResourceMonitor::emergency_reason() const {
    std::lock_guard lock(reason_mutex_);
    return reason_;
}

} // namespace unidb
