#include "service/database_service.hpp"
#include "core/request_counters.hpp"
#include "core/utils.hpp"
#include "db/engine_registry.hpp"
#include <format>
#include <mutex>

namespace unidb {

bool breaks_connection(ErrorCode code) {
    switch (code) {
        case ErrorCode::CONNECTION_FAILED:
        case ErrorCode::OPERATION_FAILED:
        case ErrorCode::TIMEOUT:
            return true;
        default:
            return false;
    }
}

namespace {

Result<void> check_statement(IQueryValidator& validator,
                             std::string_view statement,
                             const CallerContext& context) {
    const auto verdict = validator.validate(statement, context);
    switch (verdict.verdict) {
        case ValidationVerdict::DENIED:
            utils::log::warn(std::format("Statement denied for user '{}': {}",
                context.user_id, verdict.message));
            return Result<void>::error(ErrorCode::SECURITY_VIOLATION,
                std::format("statement denied: {}", verdict.message));
        case ValidationVerdict::WARNING:
            utils::log::warn(std::format("Statement warning for user '{}': {}",
                context.user_id, verdict.message));
            break;
        case ValidationVerdict::APPROVED:
            break;
    }
    return Result<void>::ok();
}

} // namespace

// ============================================================================
// TransactionSession
// ============================================================================

TransactionSession::TransactionSession(std::shared_ptr<State> state,
                                       std::shared_ptr<SafetyManager> safety,
                                       std::shared_ptr<IQueryValidator> validator,
                                       CallerContext context,
                                       std::chrono::milliseconds budget)
    : state_(std::move(state)),
      safety_(std::move(safety)),
      validator_(std::move(validator)),
      context_(std::move(context)),
      budget_(budget),
      info_(state_->tx->info()) {}

template<typename T, typename Fn>
Result<T> TransactionSession::run(std::string_view operation, Fn fn) {
    if (abandoned_) {
        return Result<T>::error(ErrorCode::TRANSACTION_FAILED,
            std::format("transaction {} was abandoned after a failed call", info_.id));
    }
    if (!active_) {
        return Result<T>::error(ErrorCode::VALIDATION_ERROR, "transaction is not active");
    }

    // The worker shares the state so a timed-out call cannot outlive it
    auto result = safety_->safe_execute(
        [state = state_, fn = std::move(fn)]() mutable -> Result<T> {
            return fn(*state->tx);
        },
        operation, budget_);

    if (result.is_error() && breaks_connection(result.error_code())) {
        abandoned_ = true;
        state_->lease->mark_broken();
        utils::log::warn(std::format("Transaction {} abandoned after {}: {}",
            info_.id, operation, result.error_message()));
        return result;
    }

    info_ = state_->tx->info();
    active_ = state_->tx->is_active();
    if (!active_) {
        // Terminal: hand the connection back now rather than at destruction
        state_->tx.reset();
        state_->lease.reset();
    }
    return result;
}

Result<QueryResult> TransactionSession::query(const std::string& sql,
                                              const std::vector<Value>& params) {
    if (validator_) {
        if (auto check = check_statement(*validator_, sql, context_); check.is_error()) {
            return check.as_error<QueryResult>();
        }
    }
    return run<QueryResult>("transaction.query",
        [sql, params](Transaction& tx) { return tx.query(sql, params); });
}

Result<ExecuteResult> TransactionSession::execute(const std::string& sql,
                                                  const std::vector<Value>& params) {
    if (validator_) {
        if (auto check = check_statement(*validator_, sql, context_); check.is_error()) {
            return check.as_error<ExecuteResult>();
        }
    }
    return run<ExecuteResult>("transaction.execute",
        [sql, params](Transaction& tx) { return tx.execute(sql, params); });
}

Result<void> TransactionSession::commit() {
    return run<void>("transaction.commit", [](Transaction& tx) { return tx.commit(); });
}

Result<void> TransactionSession::rollback() {
    return run<void>("transaction.rollback", [](Transaction& tx) { return tx.rollback(); });
}

Result<void> TransactionSession::savepoint(const std::string& name) {
    return run<void>("transaction.savepoint",
        [name](Transaction& tx) { return tx.savepoint(name); });
}

Result<void> TransactionSession::rollback_to_savepoint(const std::string& name) {
    return run<void>("transaction.rollback_to_savepoint",
        [name](Transaction& tx) { return tx.rollback_to_savepoint(name); });
}

Result<void> TransactionSession::release_savepoint(const std::string& name) {
    return run<void>("transaction.release_savepoint",
        [name](Transaction& tx) { return tx.release_savepoint(name); });
}

Result<void> TransactionSession::set_isolation_level(IsolationLevel level) {
    return run<void>("transaction.set_isolation_level",
        [level](Transaction& tx) { return tx.set_isolation_level(level); });
}

// ============================================================================
// DatabaseService: construction & databases
// ============================================================================

DatabaseService::DatabaseService(std::shared_ptr<SafetyManager> safety,
                                 std::shared_ptr<IQueryValidator> validator)
    : safety_(safety ? std::move(safety) : std::make_shared<SafetyManager>()),
      validator_(std::move(validator)) {
    RequestCounters::initialize();
}

DatabaseService::~DatabaseService() {
    pools_.stop_maintenance();
}

Result<std::unique_ptr<DatabaseService>> DatabaseService::from_config(
    const CoreConfig& config,
    std::shared_ptr<IQueryValidator> validator) {
    using R = Result<std::unique_ptr<DatabaseService>>;

    register_builtin_engines();

    SafetyManager::Config safety_config;
    safety_config.timeouts = config.safety.timeouts;
    safety_config.max_active_operations = config.safety.max_active_operations;
    safety_config.breaker.failure_threshold = config.circuit_breaker.failure_threshold;
    safety_config.breaker.success_threshold = config.circuit_breaker.success_threshold;
    safety_config.breaker.recovery_timeout = config.circuit_breaker.recovery_timeout;

    auto service = std::make_unique<DatabaseService>(
        std::make_shared<SafetyManager>("unidb", safety_config), std::move(validator));

    for (const auto& db : config.databases) {
        if (auto added = service->add_database(db); added.is_error()) {
            return added.as_error<std::unique_ptr<DatabaseService>>();
        }
    }

    if (config.active_database) {
        if (auto switched = service->switch_engine(*config.active_database); switched.is_error()) {
            return switched.as_error<std::unique_ptr<DatabaseService>>();
        }
    }

    if (config.safety.maintenance_interval.count() > 0) {
        service->pools_.start_maintenance(config.safety.maintenance_interval);
    }

    return R::ok(std::move(service));
}

Result<void> DatabaseService::add_database(const DatabaseConfig& config) {
    auto engine = EngineRegistry::instance().create(config);
    if (engine.is_error()) {
        return engine.as_error<void>();
    }
    return add_database(config, std::move(engine.value()));
}

Result<void> DatabaseService::add_database(const DatabaseConfig& config,
                                           std::shared_ptr<IDbEngine> engine) {
    auto pool = pools_.add_engine(config.name, std::move(engine), config);
    if (pool.is_error()) {
        return pool.as_error<void>();
    }

    auto chain = std::make_shared<ValidatorChain>();
    chain->add(std::make_shared<LocalQueryGuard>(config.security));
    if (validator_) {
        chain->add(validator_);
    }

    auto db = std::make_shared<Database>();
    db->config = config;
    db->pool = std::move(pool.value());
    db->validator = std::move(chain);

    bool activated = false;
    {
        std::unique_lock lock(mutex_);
        databases_[config.name] = std::move(db);
        if (!active_) {
            active_ = config.name;
            activated = true;
        }
    }

    utils::log::info(std::format("Database '{}' ({}) added{}", config.name,
        database_type_to_string(config.type), activated ? ", active" : ""));
    return Result<void>::ok();
}

bool DatabaseService::remove_database(const std::string& name) {
    {
        std::unique_lock lock(mutex_);
        if (databases_.erase(name) == 0) {
            return false;
        }
        if (active_ == name) {
            active_.reset();
        }
    }
    pools_.remove_engine(name);
    utils::log::info(std::format("Database '{}' removed", name));
    return true;
}

Result<void> DatabaseService::switch_engine(const std::string& name) {
    {
        std::unique_lock lock(mutex_);
        if (!databases_.contains(name)) {
            return Result<void>::error(ErrorCode::CONFIGURATION_ERROR,
                std::format("unknown database: {}", name));
        }
        active_ = name;
    }
    RequestCounters::record_engine_switch();
    utils::log::info(std::format("Active database switched to '{}'", name));
    return Result<void>::ok();
}

std::optional<std::string> DatabaseService::active_database() const {
    std::shared_lock lock(mutex_);
    return active_;
}

std::vector<std::string> DatabaseService::database_names() const {
    return pools_.engine_ids();
}

// ============================================================================
// DatabaseService: request flow
// ============================================================================

Result<std::shared_ptr<DatabaseService::Database>> DatabaseService::active() const {
    using R = Result<std::shared_ptr<Database>>;
    std::shared_lock lock(mutex_);
    if (!active_) {
        return R::error(ErrorCode::CONFIGURATION_ERROR, "no active database");
    }
    const auto it = databases_.find(*active_);
    if (it == databases_.end()) {
        return R::error(ErrorCode::CONFIGURATION_ERROR,
            std::format("unknown database: {}", *active_));
    }
    return R::ok(it->second);
}

Result<void> DatabaseService::preflight(const Database& db,
                                        std::string_view statement,
                                        const CallerContext& context) const {
    return check_statement(*db.validator, statement, context);
}

Result<std::unique_ptr<PooledConnection>> DatabaseService::lease(const Database& db) {
    return safety_->safe_pool_operation(
        [pool = db.pool]() { return pool->acquire(); }, "pool.acquire");
}

template<typename T, typename Fn>
Result<T> DatabaseService::with_connection(const Database& db, std::string_view operation, Fn fn) {
    auto leased = lease(db);
    if (leased.is_error()) {
        return leased.as_error<T>();
    }

    // Shared with the worker: a timed-out call keeps its connection until it ends
    std::shared_ptr<PooledConnection> conn(std::move(leased.value()));

    auto result = safety_->safe_execute(
        [conn, fn = std::move(fn)]() mutable -> Result<T> {
            auto r = fn(*conn->get());
            conn.reset();
            return r;
        },
        operation, db.config.features.query_timeout);

    if (result.is_error() && breaks_connection(result.error_code())) {
        conn->mark_broken();
    }
    return result;
}

Result<QueryResult> DatabaseService::execute_query(const std::string& sql,
                                                   const std::vector<Value>& params,
                                                   const CallerContext& context) {
    auto db = active();
    if (db.is_error()) return db.as_error<QueryResult>();
    if (auto check = preflight(*db.value(), sql, context); check.is_error()) {
        return check.as_error<QueryResult>();
    }

    return with_connection<QueryResult>(*db.value(), "execute_query",
        [sql, params](DbConnection& conn) { return conn.query(sql, params); });
}

Result<ExecuteResult> DatabaseService::execute_command(const std::string& sql,
                                                       const std::vector<Value>& params,
                                                       const CallerContext& context) {
    auto db = active();
    if (db.is_error()) return db.as_error<ExecuteResult>();
    if (auto check = preflight(*db.value(), sql, context); check.is_error()) {
        return check.as_error<ExecuteResult>();
    }

    return with_connection<ExecuteResult>(*db.value(), "execute_command",
        [sql, params](DbConnection& conn) { return conn.execute(sql, params); });
}

Result<DatabaseSchema> DatabaseService::get_schema(const CallerContext& context) {
    auto db = active();
    if (db.is_error()) return db.as_error<DatabaseSchema>();

    utils::log::debug(std::format("Schema requested by '{}' on '{}'",
        context.user_id, db.value()->config.name));
    return with_connection<DatabaseSchema>(*db.value(), "get_schema",
        [](DbConnection& conn) { return conn.get_schema(); });
}

Result<std::unique_ptr<TransactionSession>> DatabaseService::begin_transaction(
    IsolationLevel level, bool read_only, const CallerContext& context) {
    using R = Result<std::unique_ptr<TransactionSession>>;

    auto db = active();
    if (db.is_error()) return db.as_error<std::unique_ptr<TransactionSession>>();
    const auto budget = db.value()->config.features.query_timeout;

    auto leased = lease(*db.value());
    if (leased.is_error()) return leased.as_error<std::unique_ptr<TransactionSession>>();

    auto state = std::make_shared<TransactionSession::State>();
    state->lease = std::move(leased.value());

    auto begun = safety_->safe_execute(
        [state, level, read_only]() -> Result<void> {
            auto tx = state->lease->get()->begin_transaction(level, read_only);
            if (tx.is_error()) return tx.as_error<void>();
            state->tx = std::move(tx.value());
            return Result<void>::ok();
        },
        "begin_transaction", budget);

    if (begun.is_error()) {
        if (breaks_connection(begun.error_code())) {
            state->lease->mark_broken();
        }
        return begun.as_error<std::unique_ptr<TransactionSession>>();
    }

    return R::ok(std::unique_ptr<TransactionSession>(new TransactionSession(
        std::move(state), safety_, db.value()->validator, context, budget)));
}

Result<std::vector<Value>> DatabaseService::execute_batch(
    const std::vector<IBatchDriver::Command>& commands,
    const CallerContext& context) {
    auto db = active();
    if (db.is_error()) return db.as_error<std::vector<Value>>();
    for (const auto& command : commands) {
        if (auto check = preflight(*db.value(), command.text, context); check.is_error()) {
            return check.as_error<std::vector<Value>>();
        }
    }

    return with_connection<std::vector<Value>>(*db.value(), "execute_batch",
        [commands](DbConnection& conn) -> Result<std::vector<Value>> {
            auto batch = conn.begin_batch();
            if (batch.is_error()) return batch.as_error<std::vector<Value>>();
            for (const auto& command : commands) {
                if (auto queued = batch.value()->queue(command.text, command.params);
                    queued.is_error()) {
                    return queued.as_error<std::vector<Value>>();
                }
            }
            return batch.value()->commit();
        });
}

// ============================================================================
// Health
// ============================================================================

std::vector<std::pair<std::string, HealthStatus>> DatabaseService::health_check_all() const {
    return pools_.health_check_all();
}

Result<PoolStats> DatabaseService::pool_stats(const std::string& name) const {
    auto pool = pools_.get_pool(name);
    if (pool.is_error()) return pool.as_error<PoolStats>();
    return Result<PoolStats>::ok(pool.value()->get_stats());
}

} // namespace unidb
