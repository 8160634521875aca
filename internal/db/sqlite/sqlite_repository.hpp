#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace doccache::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  std::size_t MaxParametersPerQuery() const override;

  Result UpsertRemoteDocument(Transaction&, const model::RemoteDocumentRecord&) override;
  Result DeleteRemoteDocument(Transaction&, const std::string& path) override;
  std::optional<model::RemoteDocumentRecord> GetRemoteDocument(Transaction&, const std::string& path) override;
  std::vector<model::RemoteDocumentRecord> GetRemoteDocuments(Transaction&, const std::vector<std::string>& paths) override;
  std::vector<model::RemoteDocumentRecord> ScanRemoteDocuments(Transaction&, const std::string& start,
                                                               const std::optional<std::string>& end) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
  static sqlite3_stmt* PrepareOrThrow(sqlite3* db, const std::string& sql);
  static std::vector<model::RemoteDocumentRecord> CollectRows(sqlite3* db, sqlite3_stmt* st);
};

}
