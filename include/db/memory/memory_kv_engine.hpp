#pragma once

#include "db/idb_engine.hpp"
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace unidb {

/**
 * @brief Parsed key-value command
 *
 * Grammar (verbs are case-insensitive, tokens split on whitespace):
 *   GET key | EXISTS key | DEL key | KEYS pattern | SET key value...
 *
 * A token that is exactly "?" takes the next positional parameter. A KEYS
 * pattern ending in '*' is a prefix match, otherwise an exact match.
 */
struct KvCommand {
    enum class Verb { GET, SET, DEL, EXISTS, KEYS };

    Verb verb = Verb::GET;
    std::string key;   // Key, or pattern for KEYS
    Value value;       // SET only

    [[nodiscard]] bool is_write() const { return verb == Verb::SET || verb == Verb::DEL; }

    [[nodiscard]] static Result<KvCommand> parse(const std::string& text,
                                                 const std::vector<Value>& params);
};

/**
 * @brief Key space shared by every connection of one MemoryKvEngine
 *
 * Reads take the shared lock, writes and batch application the exclusive
 * lock, so a committed batch is observed entirely or not at all.
 */
class MemoryStore {
public:
    [[nodiscard]] std::optional<Value> get(const std::string& key) const;
    [[nodiscard]] std::vector<std::string> keys(const std::string& pattern) const;

    /**
     * @brief Run one SET or DEL
     * @return Keys written or removed
     */
    uint64_t run_write(const KvCommand& cmd);

    /**
     * @brief Apply commands in order under one exclusive lock
     * @return One Value per command: GET value (or null), SET 1, DEL removed
     *         count, EXISTS bool, KEYS a JSON array of keys
     */
    [[nodiscard]] std::vector<Value> apply_all(const std::vector<KvCommand>& commands);

    [[nodiscard]] size_t size() const;

private:
    Value apply_locked(const KvCommand& cmd);

    mutable std::shared_mutex mutex_;
    std::map<std::string, Value> data_;
};

/**
 * @brief Connection to the in-process key-value store
 *
 * query() runs GET, EXISTS and KEYS; execute() runs SET and DEL. No
 * transactions: begin_transaction() fails with UNSUPPORTED_OPERATION and
 * begin_batch() is the atomic multi-command primitive.
 */
class MemoryKvConnection : public DbConnection {
public:
    MemoryKvConnection(std::shared_ptr<MemoryStore> store,
                       FeatureSet features,
                       const ConnectionConfig& config);

    [[nodiscard]] Result<void> ping() override;
    [[nodiscard]] bool is_connected() const override { return connected_; }
    void close() override { connected_ = false; }

protected:
    [[nodiscard]] Result<QueryResult> do_query(const std::string& command,
                                               const std::vector<Value>& params) override;
    [[nodiscard]] Result<ExecuteResult> do_execute(const std::string& command,
                                                   const std::vector<Value>& params) override;
    [[nodiscard]] Result<std::unique_ptr<IBatchDriver>> do_begin_batch() override;

private:
    [[nodiscard]] Result<void> check_open() const;

    std::shared_ptr<MemoryStore> store_;
    bool connected_ = true;
};

/**
 * @brief Built-in in-memory key-value engine (BATCHED_COMMANDS,
 * EVENTUAL_CONSISTENCY)
 *
 * Needs no external library. Each engine instance owns one store; all
 * connections opened by it see the same data.
 */
class MemoryKvEngine : public IDbEngine {
public:
    static constexpr const char* kVersion = "unidb-memory-kv 1.0";

    explicit MemoryKvEngine(const DatabaseConfig& config);

    [[nodiscard]] DatabaseType type() const override { return DatabaseType::MEMORY_KV; }

    [[nodiscard]] Result<std::unique_ptr<DbConnection>> connect(
        const ConnectionConfig& config) override;

    [[nodiscard]] HealthStatus health_check() override;

    [[nodiscard]] FeatureSet supported_features() const override { return features_; }

    [[nodiscard]] Result<void> validate_config(const DatabaseConfig& config) const override;

    [[nodiscard]] Result<std::string> version() override {
        return Result<std::string>::ok(kVersion);
    }

    [[nodiscard]] const std::shared_ptr<MemoryStore>& store() const { return store_; }

private:
    FeatureSet features_;
    std::shared_ptr<MemoryStore> store_;
};

} // namespace unidb
