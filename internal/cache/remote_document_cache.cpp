#include "internal/cache/remote_document_cache.hpp"

#include <algorithm>
#include <cstdint>
#include <map>
#include <string>

#include "internal/encoding/encoded_path.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace doccache::cache {

using encoding::EncodedPath;
using observability::IntField;
using observability::StringField;

namespace {

std::string PathForKey(const model::DocumentKey& key) {
  return EncodedPath::Encode(key.path());
}

} // namespace

RemoteDocumentCache::RemoteDocumentCache(std::shared_ptr<db::Repository> repository, std::size_t max_batch_keys)
    : repository_(std::move(repository)), max_batch_keys_(max_batch_keys == 0 ? kDefaultMaxBatchKeys : max_batch_keys) {
  if (!repository_) {
    throw util::InvalidArgument("remote document cache: repository is required");
  }

  const auto host_limit = repository_->MaxParametersPerQuery();
  if (max_batch_keys_ > host_limit) {
    throw util::InvalidArgument("remote document cache: max_batch_keys " + std::to_string(max_batch_keys_) +
                                " exceeds the store's parameter limit " + std::to_string(host_limit));
  }
}

void RemoteDocumentCache::Add(db::Transaction& tx, const model::MaybeDocument& doc) {
  db::model::RemoteDocumentRecord record{PathForKey(model::KeyOf(doc)), serializer_.Encode(doc)};
  DOCCACHE_LOG_DEBUG("remote document cache: add", {StringField("key", model::KeyOf(doc).ToString()), StringField("type", model::DescribeVariant(doc)),
                                                    IntField("bytes", static_cast<std::int64_t>(record.contents.size()))});
  util::ThrowIfDbError(repository_->UpsertRemoteDocument(tx, record), "add remote document " + model::KeyOf(doc).ToString());
}

void RemoteDocumentCache::Remove(db::Transaction& tx, const model::DocumentKey& key) {
  util::ThrowIfDbError(repository_->DeleteRemoteDocument(tx, PathForKey(key)), "remove remote document " + key.ToString());
}

std::optional<model::MaybeDocument> RemoteDocumentCache::Get(db::Transaction& tx, const model::DocumentKey& key) {
  auto record = repository_->GetRemoteDocument(tx, PathForKey(key));
  if (!record.has_value()) return std::nullopt;
  return DecodeRecord(*record);
}

std::vector<model::MaybeDocument> RemoteDocumentCache::GetAll(db::Transaction& tx, const std::vector<model::DocumentKey>& keys) {
  std::vector<model::MaybeDocument> result;
  if (keys.empty()) {
    return result;
  }

  std::size_t queries_performed = 0;
  for (std::size_t offset = 0; offset < keys.size(); offset += max_batch_keys_) {
    const auto chunk_end = std::min(keys.size(), offset + max_batch_keys_);

    std::vector<std::string> paths;
    paths.reserve(chunk_end - offset);
    for (std::size_t i = offset; i < chunk_end; ++i) {
      paths.push_back(PathForKey(keys[i]));
    }

    ++queries_performed;
    for (const auto& record : repository_->GetRemoteDocuments(tx, paths)) {
      result.push_back(DecodeRecord(record));
    }
  }

  // Each lookup returns rows ordered by path, but nothing orders rows across
  // lookups. The single-chunk case is the common one and needs no sort.
  if (queries_performed > 1) {
    DOCCACHE_LOG_DEBUG("remote document cache: merging chunked lookup",
                       {IntField("keys", static_cast<std::int64_t>(keys.size())), IntField("queries", static_cast<std::int64_t>(queries_performed))});
    std::sort(result.begin(), result.end(),
              [](const model::MaybeDocument& lhs, const model::MaybeDocument& rhs) { return model::KeyOf(lhs) < model::KeyOf(rhs); });
  }
  return result;
}

model::DocumentMap RemoteDocumentCache::GetAllMatchingQuery(db::Transaction& tx, const model::Query& query) {
  const auto& prefix                         = query.path();
  const auto  immediate_children_path_length = prefix.length() + 1;

  const auto prefix_path           = EncodedPath::Encode(prefix);
  const auto prefix_successor_path = EncodedPath::PrefixSuccessor(prefix_path);

  const auto rows = repository_->ScanRemoteDocuments(tx, prefix_path, prefix_successor_path);

  std::map<model::DocumentKey, model::Document> results;
  for (const auto& row : rows) {
    // The range covers the whole subtree under the prefix, so a query on
    // 'rooms' also scans rooms/abc/messages/xyz. Only immediate children
    // belong to the collection.
    const auto path = EncodedPath::Decode(row.path);
    if (path.length() != immediate_children_path_length) {
      continue;
    }

    auto maybe_doc = DecodeRecord(row);
    auto* doc      = std::get_if<model::Document>(&maybe_doc);
    if (doc == nullptr) {
      continue;
    }

    if (!query.Matches(*doc)) {
      continue;
    }

    auto key = doc->key;
    results.insert_or_assign(std::move(key), std::move(*doc));
  }

  DOCCACHE_LOG_DEBUG("remote document cache: collection scan",
                     {StringField("collection", prefix.CanonicalString()), IntField("scanned", static_cast<std::int64_t>(rows.size())),
                      IntField("matched", static_cast<std::int64_t>(results.size()))});

  return model::DocumentMap(std::move(results));
}

model::MaybeDocument RemoteDocumentCache::DecodeRecord(const db::model::RemoteDocumentRecord& record) const {
  try {
    auto doc = serializer_.Decode(record.contents);
    if (PathForKey(model::KeyOf(doc)) != record.path) {
      throw util::Corruption("MaybeDocument stored under '" + EncodedPath::Decode(record.path).CanonicalString() + "' carries key '" +
                             model::KeyOf(doc).ToString() + "'");
    }
    return doc;
  } catch (const util::Corruption& e) {
    DOCCACHE_LOG_ERROR("remote document cache: corrupt record", {IntField("path_bytes", static_cast<std::int64_t>(record.path.size())),
                                                                 StringField("error", e.what())});
    throw;
  }
}

} // namespace doccache::cache
