#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <cstdint>
#include <cstdlib>
#include <format>
#include <stdexcept>
#include <unordered_set>

using namespace std::string_literals;

namespace unidb {

// ============================================================================
// TOML helpers (env expansion, typed reads)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns with environment variables (unset = empty)
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            if (const char* env_val = std::getenv(var_name.c_str())) {
                result += env_val;
            }
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_node(toml::node& node);

void expand_table(toml::table& tbl) {
    for (auto&& [key, val] : tbl) {
        expand_node(val);
    }
}

void expand_node(toml::node& node) {
    if (auto* s = node.as_string()) {
        *s = expand_env_vars(s->get());
    } else if (auto* tbl = node.as_table()) {
        expand_table(*tbl);
    } else if (auto* arr = node.as_array()) {
        for (auto& elem : *arr) {
            expand_node(elem);
        }
    }
}

std::chrono::milliseconds millis_or(const toml::table& tbl, std::string_view key,
                                    std::chrono::milliseconds fallback) {
    return std::chrono::milliseconds(tbl[key].value_or(int64_t{fallback.count()}));
}

// Non-negative count; a negative value is reported and the fallback kept
size_t count_or(const toml::table& tbl, std::string_view key, size_t fallback,
                std::string_view path, std::vector<std::string>& errors) {
    const auto value = tbl[key].value<int64_t>();
    if (!value) return fallback;
    if (*value < 0) {
        errors.push_back(std::format("{}.{} must not be negative, got {}", path, key, *value));
        return fallback;
    }
    return static_cast<size_t>(*value);
}

std::vector<std::string> string_array(const toml::table& tbl, std::string_view key) {
    std::vector<std::string> result;
    if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                result.emplace_back(s->get());
            }
        }
    }
    return result;
}

ConnectionConfig extract_connection(const toml::table& tbl, const std::string& path,
                                    std::vector<std::string>& errors) {
    ConnectionConfig cfg;
    cfg.host = tbl["host"].value_or(cfg.host);
    cfg.database = tbl["database"].value_or(""s);
    cfg.username = tbl["username"].value_or(""s);
    cfg.password = tbl["password"].value_or(""s);
    if (const auto ssl = tbl["ssl_mode"].value<std::string>()) {
        cfg.ssl_mode = *ssl;
    }
    cfg.connect_timeout = millis_or(tbl, "connect_timeout_ms", cfg.connect_timeout);

    const int64_t port = tbl["port"].value_or(int64_t{0});
    if (port < 0 || port > 65535) {
        errors.push_back(std::format("{}.port must be 0-65535, got {}", path, port));
    } else {
        cfg.port = static_cast<uint16_t>(port);
    }

    if (const auto* options = tbl["options"].as_table()) {
        for (auto&& [key, val] : *options) {
            if (const auto s = val.value<std::string>()) {
                cfg.options.emplace(std::string(key.str()), *s);
            } else {
                errors.push_back(std::format("{}.options.{} must be a string", path, key.str()));
            }
        }
    }
    return cfg;
}

PoolConfig extract_pool(const toml::table& tbl, const std::string& path,
                        std::vector<std::string>& errors) {
    PoolConfig cfg;
    cfg.min_connections = count_or(tbl, "min_connections", cfg.min_connections, path, errors);
    cfg.max_connections = count_or(tbl, "max_connections", cfg.max_connections, path, errors);
    cfg.connection_timeout = millis_or(tbl, "connection_timeout_ms", cfg.connection_timeout);
    cfg.idle_timeout = millis_or(tbl, "idle_timeout_ms", cfg.idle_timeout);
    cfg.max_lifetime = millis_or(tbl, "max_lifetime_ms", cfg.max_lifetime);
    return cfg;
}

SecurityConfig extract_security(const toml::table& tbl, const std::string& path,
                                std::vector<std::string>& errors) {
    SecurityConfig cfg;
    cfg.enabled = tbl["enabled"].value_or(cfg.enabled);
    cfg.max_query_length = count_or(tbl, "max_query_length", cfg.max_query_length, path, errors);

    if (tbl.contains("allowed_operations")) {
        cfg.allowed_operations.clear();
        for (const auto& name : string_array(tbl, "allowed_operations")) {
            if (const auto type = parse_statement_type(name)) {
                cfg.allowed_operations.push_back(*type);
            } else {
                errors.push_back(std::format("{}.allowed_operations: unknown statement type '{}'",
                    path, name));
            }
        }
    }
    return cfg;
}

FeatureConfig extract_features(const toml::table& tbl) {
    FeatureConfig cfg;
    cfg.enable_transactions = tbl["enable_transactions"].value_or(cfg.enable_transactions);
    cfg.enable_prepared_statements =
        tbl["enable_prepared_statements"].value_or(cfg.enable_prepared_statements);
    cfg.enable_schema_introspection =
        tbl["enable_schema_introspection"].value_or(cfg.enable_schema_introspection);
    cfg.query_timeout = millis_or(tbl, "query_timeout_ms", cfg.query_timeout);
    return cfg;
}

} // anonymous namespace

// ============================================================================
// Section extraction
// ============================================================================

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    if (const auto* logging = root["logging"].as_table()) {
        cfg.level = (*logging)["level"].value_or(cfg.level);
    }
    return cfg;
}

SafetySettings ConfigLoader::extract_safety(const toml::table& root) {
    SafetySettings cfg;
    const auto* safety = root["safety"].as_table();
    if (!safety) return cfg;
    const auto& s = *safety;

    auto& t = cfg.timeouts;
    t.default_timeout      = millis_or(s, "default_timeout_ms", t.default_timeout);
    t.connection_timeout   = millis_or(s, "connection_timeout_ms", t.connection_timeout);
    t.query_timeout        = millis_or(s, "query_timeout_ms", t.query_timeout);
    t.pool_timeout         = millis_or(s, "pool_timeout_ms", t.pool_timeout);
    t.health_check_timeout = millis_or(s, "health_check_timeout_ms", t.health_check_timeout);

    cfg.max_active_operations = static_cast<size_t>(
        s["max_active_operations"].value_or(int64_t{static_cast<int64_t>(cfg.max_active_operations)}));
    cfg.maintenance_interval = millis_or(s, "maintenance_interval_ms", cfg.maintenance_interval);
    return cfg;
}

CircuitBreakerSettings ConfigLoader::extract_circuit_breaker(const toml::table& root) {
    CircuitBreakerSettings cfg;
    const auto* cb = root["circuit_breaker"].as_table();
    if (!cb) return cfg;

    cfg.failure_threshold = static_cast<uint32_t>((*cb)["failure_threshold"].value_or(int64_t{cfg.failure_threshold}));
    cfg.success_threshold = static_cast<uint32_t>((*cb)["success_threshold"].value_or(int64_t{cfg.success_threshold}));
    cfg.recovery_timeout = millis_or(*cb, "recovery_timeout_ms", cfg.recovery_timeout);
    return cfg;
}

std::vector<DatabaseConfig> ConfigLoader::extract_databases(const toml::table& root,
                                                            std::vector<std::string>& errors) {
    std::vector<DatabaseConfig> result;
    const auto* arr = root["databases"].as_array();
    if (!arr) return result;
    result.reserve(arr->size());

    for (size_t i = 0; i < arr->size(); ++i) {
        const auto* db = (*arr)[i].as_table();
        const std::string path = std::format("databases[{}]", i);
        if (!db) {
            errors.push_back(std::format("{} must be a table", path));
            continue;
        }

        DatabaseConfig cfg;
        cfg.name = (*db)["name"].value_or(""s);

        const std::string type_str = (*db)["type"].value_or("postgresql"s);
        if (const auto type = parse_database_type(type_str)) {
            cfg.type = *type;
        } else {
            errors.push_back(std::format("{}.type: unknown database type '{}'", path, type_str));
        }

        if (const auto* conn = (*db)["connection"].as_table()) {
            cfg.connection = extract_connection(*conn, path + ".connection", errors);
        }
        if (const auto* pool = (*db)["pool"].as_table()) {
            cfg.pool = extract_pool(*pool, path + ".pool", errors);
        }
        if (const auto* security = (*db)["security"].as_table()) {
            cfg.security = extract_security(*security, path + ".security", errors);
        }
        if (const auto* features = (*db)["features"].as_table()) {
            cfg.features = extract_features(*features);
        }

        result.emplace_back(std::move(cfg));
    }
    return result;
}

// ---- Shared extraction + validation ----------------------------------------

ConfigLoader::LoadResult ConfigLoader::extract_and_validate(const toml::table& root) {
    std::vector<std::string> errors;

    CoreConfig config;
    config.logging = extract_logging(root);
    config.safety = extract_safety(root);
    config.circuit_breaker = extract_circuit_breaker(root);
    config.databases = extract_databases(root, errors);
    if (const auto active = root["active_database"].value<std::string>()) {
        config.active_database = *active;
    }

    for (auto& err : validate_config(config)) {
        errors.push_back(std::move(err));
    }

    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return LoadResult::error(std::move(combined));
    }
    return LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        auto tbl = toml::parse_file(config_path);
        expand_table(tbl);
        return extract_and_validate(tbl);
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        auto tbl = toml::parse(toml_content);
        expand_table(tbl);
        return extract_and_validate(tbl);
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const CoreConfig& config) {
    std::vector<std::string> errors;

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format("logging.level: unknown level '{}'", config.logging.level));
    }

    const auto& t = config.safety.timeouts;
    const std::pair<const char*, std::chrono::milliseconds> timeouts[] = {
        {"default_timeout_ms", t.default_timeout},
        {"connection_timeout_ms", t.connection_timeout},
        {"query_timeout_ms", t.query_timeout},
        {"pool_timeout_ms", t.pool_timeout},
        {"health_check_timeout_ms", t.health_check_timeout},
    };
    for (const auto& [key, value] : timeouts) {
        if (value.count() <= 0) {
            errors.push_back(std::format("safety.{} must be > 0", key));
        }
    }
    if (config.safety.max_active_operations == 0) {
        errors.push_back("safety.max_active_operations must be > 0");
    }
    if (config.safety.maintenance_interval.count() < 0) {
        errors.push_back("safety.maintenance_interval_ms must not be negative");
    }

    if (config.circuit_breaker.failure_threshold == 0) {
        errors.push_back("circuit_breaker.failure_threshold must be > 0");
    }
    if (config.circuit_breaker.success_threshold == 0) {
        errors.push_back("circuit_breaker.success_threshold must be > 0");
    }
    if (config.circuit_breaker.recovery_timeout.count() <= 0) {
        errors.push_back("circuit_breaker.recovery_timeout_ms must be > 0");
    }

    std::unordered_set<std::string> names;
    for (size_t i = 0; i < config.databases.size(); ++i) {
        const auto& db = config.databases[i];
        if (db.name.empty()) {
            errors.push_back(std::format("databases[{}].name must not be empty", i));
        } else if (!names.insert(db.name).second) {
            errors.push_back(std::format("databases[{}].name '{}' is a duplicate", i, db.name));
        }
        if (db.pool.max_connections == 0) {
            errors.push_back(std::format("databases[{}].pool.max_connections must be > 0", i));
        }
        if (db.pool.min_connections > db.pool.max_connections) {
            errors.push_back(std::format(
                "databases[{}].pool.min_connections ({}) > max_connections ({})",
                i, db.pool.min_connections, db.pool.max_connections));
        }
        if (db.pool.connection_timeout.count() <= 0) {
            errors.push_back(std::format("databases[{}].pool.connection_timeout_ms must be > 0", i));
        }
        if (db.features.query_timeout.count() <= 0) {
            errors.push_back(std::format("databases[{}].features.query_timeout_ms must be > 0", i));
        }
    }

    if (config.active_database && !names.contains(*config.active_database)) {
        errors.push_back(std::format("active_database '{}' is not a configured database",
            *config.active_database));
    }

    return errors;
}

} // namespace unidb
