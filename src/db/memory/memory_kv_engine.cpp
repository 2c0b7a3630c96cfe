#include "db/memory/memory_kv_engine.hpp"
#include "core/utils.hpp"
#include <format>
#include <mutex>

namespace unidb {

namespace {

const char* verb_name(KvCommand::Verb verb) {
    switch (verb) {
        case KvCommand::Verb::GET:    return "GET";
        case KvCommand::Verb::SET:    return "SET";
        case KvCommand::Verb::DEL:    return "DEL";
        case KvCommand::Verb::EXISTS: return "EXISTS";
        case KvCommand::Verb::KEYS:   return "KEYS";
        default:                      return "?";
    }
}

std::vector<std::string> match_keys(const std::map<std::string, Value>& data,
                                    const std::string& pattern) {
    std::vector<std::string> out;
    if (!pattern.empty() && pattern.back() == '*') {
        const std::string prefix = pattern.substr(0, pattern.size() - 1);
        for (auto it = data.lower_bound(prefix);
             it != data.end() && it->first.starts_with(prefix); ++it) {
            out.push_back(it->first);
        }
    } else if (data.contains(pattern)) {
        out.push_back(pattern);
    }
    return out;
}

// Batch commands are re-parsed at commit; any failure aborts before a write
class MemoryKvBatchDriver : public IBatchDriver {
public:
    explicit MemoryKvBatchDriver(std::shared_ptr<MemoryStore> store)
        : store_(std::move(store)) {}

    Result<void> validate(const std::string& command, const std::vector<Value>& params) override {
        auto cmd = KvCommand::parse(command, params);
        if (cmd.is_error()) {
            return cmd.as_error<void>();
        }
        return Result<void>::ok();
    }

    Result<std::vector<Value>> apply(const std::vector<Command>& commands) override {
        std::vector<KvCommand> parsed;
        parsed.reserve(commands.size());
        for (const auto& c : commands) {
            auto cmd = KvCommand::parse(c.text, c.params);
            if (cmd.is_error()) {
                return cmd.as_error<std::vector<Value>>();
            }
            parsed.push_back(std::move(cmd.value()));
        }
        return Result<std::vector<Value>>::ok(store_->apply_all(parsed));
    }

private:
    std::shared_ptr<MemoryStore> store_;
};

} // namespace

// ============================================================================
// KvCommand
// ============================================================================

Result<KvCommand> KvCommand::parse(const std::string& text, const std::vector<Value>& params) {
    using R = Result<KvCommand>;
    const auto tokens = utils::split_whitespace(text);
    if (tokens.empty()) {
        return R::error(ErrorCode::QUERY_FAILED, "empty command");
    }

    KvCommand cmd;
    const std::string verb = utils::to_upper(tokens[0]);
    if (verb == "GET")         cmd.verb = Verb::GET;
    else if (verb == "SET")    cmd.verb = Verb::SET;
    else if (verb == "DEL")    cmd.verb = Verb::DEL;
    else if (verb == "EXISTS") cmd.verb = Verb::EXISTS;
    else if (verb == "KEYS")   cmd.verb = Verb::KEYS;
    else {
        return R::error(ErrorCode::QUERY_FAILED, std::format("unknown command '{}'", tokens[0]));
    }

    const bool arity_ok = cmd.verb == Verb::SET ? tokens.size() >= 3 : tokens.size() == 2;
    if (!arity_ok) {
        return R::error(ErrorCode::QUERY_FAILED,
            std::format("wrong number of arguments for {}", verb_name(cmd.verb)));
    }

    // Only the key slot and a single-token SET value may be placeholders
    const bool key_param = tokens[1] == "?";
    const bool value_param = cmd.verb == Verb::SET && tokens.size() == 3 && tokens[2] == "?";
    const size_t expected = (key_param ? 1 : 0) + (value_param ? 1 : 0);
    if (params.size() != expected) {
        return R::error(ErrorCode::VALIDATION_ERROR,
            std::format("expected {} parameters, got {}", expected, params.size()));
    }

    size_t next = 0;
    if (key_param) {
        auto key = params[next++].to_text();
        if (key.is_error()) {
            return key.as_error<KvCommand>();
        }
        cmd.key = std::move(key.value());
    } else {
        cmd.key = tokens[1];
    }
    if (cmd.key.empty()) {
        return R::error(ErrorCode::VALIDATION_ERROR, "key must not be empty");
    }

    if (cmd.verb == Verb::SET) {
        if (value_param) {
            cmd.value = params[next];
        } else {
            std::string joined = tokens[2];
            for (size_t i = 3; i < tokens.size(); ++i) {
                joined += ' ';
                joined += tokens[i];
            }
            cmd.value = Value(std::move(joined));
        }
    }
    return R::ok(std::move(cmd));
}

// ============================================================================
// MemoryStore
// ============================================================================

std::optional<Value> MemoryStore::get(const std::string& key) const {
    std::shared_lock lock(mutex_);
    const auto it = data_.find(key);
    if (it == data_.end()) return std::nullopt;
    return it->second;
}

std::vector<std::string> MemoryStore::keys(const std::string& pattern) const {
    std::shared_lock lock(mutex_);
    return match_keys(data_, pattern);
}

uint64_t MemoryStore::run_write(const KvCommand& cmd) {
    std::unique_lock lock(mutex_);
    const Value result = apply_locked(cmd);
    const auto* n = result.get_if<int64_t>();
    return n ? static_cast<uint64_t>(*n) : 0;
}

std::vector<Value> MemoryStore::apply_all(const std::vector<KvCommand>& commands) {
    std::vector<Value> results;
    results.reserve(commands.size());
    std::unique_lock lock(mutex_);
    for (const auto& cmd : commands) {
        results.push_back(apply_locked(cmd));
    }
    return results;
}

size_t MemoryStore::size() const {
    std::shared_lock lock(mutex_);
    return data_.size();
}

Value MemoryStore::apply_locked(const KvCommand& cmd) {
    switch (cmd.verb) {
        case KvCommand::Verb::GET: {
            const auto it = data_.find(cmd.key);
            return it != data_.end() ? it->second : Value{};
        }
        case KvCommand::Verb::SET:
            data_.insert_or_assign(cmd.key, cmd.value);
            return Value(int64_t{1});
        case KvCommand::Verb::DEL:
            return Value(static_cast<int64_t>(data_.erase(cmd.key)));
        case KvCommand::Verb::EXISTS:
            return Value(data_.contains(cmd.key));
        case KvCommand::Verb::KEYS:
            return Value::json(Json(match_keys(data_, cmd.key)));
        default:
            return Value{};
    }
}

// ============================================================================
// MemoryKvConnection
// ============================================================================

MemoryKvConnection::MemoryKvConnection(std::shared_ptr<MemoryStore> store,
                                       FeatureSet features,
                                       const ConnectionConfig& config)
    : DbConnection(features), store_(std::move(store)) {
    info_.database_name = config.database.empty() ? "memory" : config.database;
    info_.user = config.username;
    info_.server_version = MemoryKvEngine::kVersion;
}

Result<void> MemoryKvConnection::ping() {
    return check_open();
}

Result<void> MemoryKvConnection::check_open() const {
    if (!connected_) {
        return Result<void>::error(ErrorCode::CONNECTION_FAILED, "connection is closed");
    }
    return Result<void>::ok();
}

Result<QueryResult> MemoryKvConnection::do_query(const std::string& command,
                                                 const std::vector<Value>& params) {
    if (auto open = check_open(); open.is_error()) {
        return open.as_error<QueryResult>();
    }
    auto parsed = KvCommand::parse(command, params);
    if (parsed.is_error()) {
        return parsed.as_error<QueryResult>();
    }
    const KvCommand& cmd = parsed.value();
    if (cmd.is_write()) {
        return Result<QueryResult>::error(ErrorCode::VALIDATION_ERROR,
            std::format("{} is a write command, use execute()", verb_name(cmd.verb)));
    }

    QueryResult result;
    switch (cmd.verb) {
        case KvCommand::Verb::GET:
            result.columns = {{"key", "string", false, std::nullopt},
                              {"value", "any", true, std::nullopt}};
            if (auto value = store_->get(cmd.key)) {
                result.rows.push_back({Value(cmd.key), std::move(*value)});
            }
            break;
        case KvCommand::Verb::EXISTS:
            result.columns = {{"exists", "bool", false, std::nullopt}};
            result.rows.push_back({Value(store_->get(cmd.key).has_value())});
            break;
        case KvCommand::Verb::KEYS:
            result.columns = {{"key", "string", false, std::nullopt}};
            for (auto& key : store_->keys(cmd.key)) {
                result.rows.push_back({Value(std::move(key))});
            }
            break;
        default:
            break;
    }
    result.total_rows = result.rows.size();
    return Result<QueryResult>::ok(std::move(result));
}

Result<ExecuteResult> MemoryKvConnection::do_execute(const std::string& command,
                                                     const std::vector<Value>& params) {
    if (auto open = check_open(); open.is_error()) {
        return open.as_error<ExecuteResult>();
    }
    auto parsed = KvCommand::parse(command, params);
    if (parsed.is_error()) {
        return parsed.as_error<ExecuteResult>();
    }
    if (!parsed->is_write()) {
        return Result<ExecuteResult>::error(ErrorCode::VALIDATION_ERROR,
            std::format("{} is a read command, use query()", verb_name(parsed->verb)));
    }

    ExecuteResult result;
    result.rows_affected = store_->run_write(parsed.value());
    return Result<ExecuteResult>::ok(result);
}

Result<std::unique_ptr<IBatchDriver>> MemoryKvConnection::do_begin_batch() {
    if (auto open = check_open(); open.is_error()) {
        return open.as_error<std::unique_ptr<IBatchDriver>>();
    }
    return Result<std::unique_ptr<IBatchDriver>>::ok(
        std::make_unique<MemoryKvBatchDriver>(store_));
}

// ============================================================================
// MemoryKvEngine
// ============================================================================

MemoryKvEngine::MemoryKvEngine(const DatabaseConfig& config)
    : features_(apply_feature_config(
          {DatabaseFeature::BATCHED_COMMANDS, DatabaseFeature::EVENTUAL_CONSISTENCY},
          config.features)),
      store_(std::make_shared<MemoryStore>()) {}

Result<std::unique_ptr<DbConnection>> MemoryKvEngine::connect(const ConnectionConfig& config) {
    return Result<std::unique_ptr<DbConnection>>::ok(
        std::make_unique<MemoryKvConnection>(store_, features_, config));
}

HealthStatus MemoryKvEngine::health_check() {
    HealthStatus status;
    status.state = HealthState::HEALTHY;
    status.last_check = std::chrono::system_clock::now();
    return status;
}

Result<void> MemoryKvEngine::validate_config(const DatabaseConfig& config) const {
    if (config.type != DatabaseType::MEMORY_KV) {
        return Result<void>::error(ErrorCode::CONFIGURATION_ERROR,
            std::format("database '{}': type {} given to the memory_kv engine",
                config.name, database_type_to_string(config.type)));
    }
    return Result<void>::ok();
}

} // namespace unidb
