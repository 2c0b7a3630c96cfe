#pragma once

#include <chrono>

namespace unidb {

/**
 * @brief Time budgets for every class of operation
 *
 * Exceeding a budget reports ErrorCode::TIMEOUT. Nothing is retried silently.
 */
struct TimeoutConfig {
    std::chrono::milliseconds default_timeout{30000};
    std::chrono::milliseconds connection_timeout{10000};
    std::chrono::milliseconds query_timeout{60000};
    std::chrono::milliseconds pool_timeout{5000};
    std::chrono::milliseconds health_check_timeout{3000};
};

} // namespace unidb
