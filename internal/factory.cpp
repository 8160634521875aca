#include "factory.hpp"

#include <memory>
#include <cstdint>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#if DOCCACHE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace doccache::factory {

using observability::IntField;
using observability::StringField;

std::shared_ptr<db::Repository> BuildRepository(const doccache::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if DOCCACHE_DB_SQLITE
    const auto& sqlite = database.sqlite();
    if (sqlite.path().empty()) {
      throw util::InvalidArgument("database.sqlite.path must be set");
    }
    const auto busy_timeout_ms = sqlite.busy_timeout_ms() ? sqlite.busy_timeout_ms() : db::sqlite::SqliteDB::kDefaultBusyTimeoutMs;

    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(sqlite.path(), busy_timeout_ms);
    sqlite_db->BootstrapSchema();
    DOCCACHE_LOG_INFO("remote document store ready", {StringField("backend", "sqlite"), StringField("path", sqlite.path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw util::InvalidArgument("sqlite backend requested but not enabled at build time");
#endif
  }

  DOCCACHE_LOG_INFO("remote document store ready", {StringField("backend", "memory")});
  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full dependency graph
*/
RuntimeDependencies Build(const doccache::runtime::config::RuntimeConfig& config) {
  RuntimeDependencies deps;
  deps.repository            = BuildRepository(config);
  deps.remote_document_cache = std::make_shared<cache::RemoteDocumentCache>(deps.repository, config.cache().max_batch_keys());

  DOCCACHE_LOG_INFO("remote document cache ready",
                    {IntField("max_batch_keys", static_cast<std::int64_t>(deps.remote_document_cache->MaxBatchKeys()))});
  return deps;
}

} // namespace doccache::factory
