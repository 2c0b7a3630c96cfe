#pragma once

#include <atomic>
#include <cstddef>
#include <mutex>
#include <string>

namespace unidb {

/**
 * @brief Caps the number of concurrently live operations and holds the
 * process-wide emergency-shutdown switch
 *
 * The counter never exceeds the ceiling, not even transiently: the slot is
 * reserved with a compare-exchange loop.
 */
class ResourceMonitor {
public:
    explicit ResourceMonitor(size_t max_active_connections = 100);

    /**
     * @brief Reserve one slot
     * @return false when the ceiling is reached (nothing is reserved)
     */
    [[nodiscard]] bool increment_connections();
    void decrement_connections();

    [[nodiscard]] size_t current_connections() const {
        return current_.load(std::memory_order_acquire);
    }
    [[nodiscard]] size_t max_connections() const { return max_; }

    /**
     * @brief Make every later safe_execute fail until reset
     */
    void trigger_emergency_shutdown(const std::string& reason);
    void reset_emergency_shutdown();

    [[nodiscard]] bool is_emergency_shutdown() const {
        return emergency_shutdown_.load(std::memory_order_acquire);
    }
    [[nodiscard]] std::string emergency_reason() const;

private:
    const size_t max_;
    std::atomic<size_t> current_{0};
    std::atomic<bool> emergency_shutdown_{false};
    mutable std::mutex reason_mutex_;
    std::string reason_;
};

/**
 * @brief RAII reservation of one ResourceMonitor slot
 *
 * Check operator bool after construction; the slot is released on every
 * exit path.
 */
class ResourceSlot {
public:
    explicit ResourceSlot(ResourceMonitor& monitor)
        : monitor_(monitor), acquired_(monitor.increment_connections()) {}

    ~ResourceSlot() {
        if (acquired_) monitor_.decrement_connections();
    }

    ResourceSlot(const ResourceSlot&) = delete;
    ResourceSlot& operator=(const ResourceSlot&) = delete;

    explicit operator bool() const { return acquired_; }

private:
    ResourceMonitor& monitor_;
    bool acquired_;
};

} // namespace unidb
