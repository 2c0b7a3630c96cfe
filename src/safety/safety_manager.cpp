#include "safety/safety_manager.hpp"

namespace unidb {

bool counts_as_breaker_failure(ErrorCode code) {
    switch (code) {
        case ErrorCode::CONNECTION_FAILED:
        case ErrorCode::QUERY_FAILED:
        case ErrorCode::OPERATION_FAILED:
        case ErrorCode::TRANSACTION_FAILED:
        case ErrorCode::POOL_ERROR:
        case ErrorCode::TIMEOUT:
            return true;
        default:
            return false;
    }
}

bool is_retryable(ErrorCode code) {
    switch (code) {
        case ErrorCode::CONNECTION_FAILED:
        case ErrorCode::OPERATION_FAILED:
        case ErrorCode::POOL_ERROR:
        case ErrorCode::TIMEOUT:
        case ErrorCode::RESOURCE_LIMIT_EXCEEDED:
            return true;
        default:
            return false;
    }
}

SafetyManager::SafetyManager(std::string name)
    : SafetyManager(std::move(name), Config{}) {}

SafetyManager::SafetyManager(std::string name, const Config& config)
    : config_(config),
      breaker_(std::make_shared<CircuitBreaker>(std::move(name), config.breaker)),
      monitor_(std::make_shared<ResourceMonitor>(config.max_active_operations)) {
    RequestCounters::initialize();
}

} // namespace unidb
