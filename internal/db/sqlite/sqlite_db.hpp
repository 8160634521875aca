#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <string>

namespace doccache::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.
*/
class SqliteDB {
 public:
  static constexpr uint32_t kDefaultBusyTimeoutMs = 5000;

  explicit SqliteDB(std::string path, uint32_t busy_timeout_ms = kDefaultBusyTimeoutMs);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, busy timeout, etc.)
  void Configure(uint32_t busy_timeout_ms);

  // Idempotent: creates the remote_documents table if missing.
  void BootstrapSchema();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace doccache::db::sqlite
