#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/document_key.hpp"
#include "internal/model/document_map.hpp"
#include "internal/model/maybe_document.hpp"
#include "internal/model/query.hpp"
#include "internal/serializer/local_serializer.hpp"

namespace doccache::cache {

/*
  Durable local mirror of server-authoritative documents.

  Every call runs inside the caller's transaction; the cache itself holds no
  locks and no state besides its configuration. Records live in the
  remote_documents keyspace:

    path     = EncodedPath::Encode(key.path())
    contents = LocalSerializer::Encode(doc)

  Errors:
    - util::Corruption for a record or key this cache could not have written
    - util::StoreFailure / util::TransactionConflict from the host store
  Absence is never an error.
*/
class RemoteDocumentCache {
 public:
  // Safely below SQLite's historical 999 host-parameter ceiling.
  static constexpr std::size_t kDefaultMaxBatchKeys = 900;

  // max_batch_keys == 0 selects kDefaultMaxBatchKeys. Throws
  // util::InvalidArgument when it exceeds what the repository accepts.
  explicit RemoteDocumentCache(std::shared_ptr<db::Repository> repository, std::size_t max_batch_keys = kDefaultMaxBatchKeys);

  // Insert or fully replace the record at doc's key.
  void Add(db::Transaction& tx, const model::MaybeDocument& doc);

  // Idempotent.
  void Remove(db::Transaction& tx, const model::DocumentKey& key);

  std::optional<model::MaybeDocument> Get(db::Transaction& tx, const model::DocumentKey& key);

  // Sorted by key; keys with no record are omitted. Issues one lookup per
  // chunk of at most MaxBatchKeys() keys, none for an empty input.
  std::vector<model::MaybeDocument> GetAll(db::Transaction& tx, const std::vector<model::DocumentKey>& keys);

  // Documents directly inside query.path() that satisfy the query.
  // Tombstones, unknown documents and nested sub-collections never match.
  model::DocumentMap GetAllMatchingQuery(db::Transaction& tx, const model::Query& query);

  std::size_t MaxBatchKeys() const {
    return max_batch_keys_;
  }

 private:
  model::MaybeDocument DecodeRecord(const db::model::RemoteDocumentRecord& record) const;

  std::shared_ptr<db::Repository> repository_;
  serializer::LocalSerializer     serializer_;
  std::size_t                     max_batch_keys_;
};

} // namespace doccache::cache
