#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/remote_document_record.hpp"

namespace doccache::db {

/*
  Host store abstraction for the remote_documents keyspace.

  CRITICAL GUARANTEES:

  - All operations run inside a caller-provided Transaction
  - Reads inside a transaction see its writes
  - Keys are opaque byte strings compared as unsigned bytes (memcmp order)
  - Multi-row reads return rows ordered by path

  Writes report failures as Result. Reads cannot report "absent" as an
  error, so a failing read throws util::StoreFailure instead.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Remote documents
  // ---------------------------------------------------------------------

  // Upper bound on bound parameters in a single statement.
  virtual std::size_t MaxParametersPerQuery() const = 0;

  // Insert or replace.
  virtual Result UpsertRemoteDocument(Transaction&, const model::RemoteDocumentRecord&) = 0;

  // Deleting an absent path succeeds.
  virtual Result DeleteRemoteDocument(Transaction&, const std::string& path) = 0;

  virtual std::optional<model::RemoteDocumentRecord> GetRemoteDocument(Transaction&, const std::string& path) = 0;

  // path IN (...) ORDER BY path; paths.size() must not exceed MaxParametersPerQuery().
  virtual std::vector<model::RemoteDocumentRecord> GetRemoteDocuments(Transaction&, const std::vector<std::string>& paths) = 0;

  // start <= path < end, ordered by path. No end means unbounded.
  virtual std::vector<model::RemoteDocumentRecord> ScanRemoteDocuments(Transaction&, const std::string& start,
                                                                       const std::optional<std::string>& end) = 0;
};

} // namespace doccache::db
