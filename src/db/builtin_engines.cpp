#include "db/engine_registry.hpp"
#include "db/memory/memory_kv_engine.hpp"
#include "db/mysql/mysql_engine.hpp"
#include "db/postgresql/pg_engine.hpp"

namespace unidb {

void register_builtin_engines(EngineRegistry& registry) {
    registry.register_engine(DatabaseType::POSTGRESQL,
        [](const DatabaseConfig& c) { return std::make_shared<PgEngine>(c); });
    registry.register_engine(DatabaseType::MYSQL,
        [](const DatabaseConfig& c) { return std::make_shared<MysqlEngine>(c); });
    registry.register_engine(DatabaseType::MEMORY_KV,
        [](const DatabaseConfig& c) { return std::make_shared<MemoryKvEngine>(c); });
}

} // namespace unidb
