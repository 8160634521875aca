#include "memory_repository.hpp"

#include "internal/util/errors.hpp"
#include "memory_tx.hpp"

namespace doccache::db::memory {

MemoryRepository::MemoryRepository(std::size_t max_parameters) : max_parameters_(max_parameters) {
}

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::UpsertRemoteDocument(Transaction& t, const model::RemoteDocumentRecord& r) {
  TX(t).Mutable().remote_documents.insert_or_assign(r.path, r.contents);
  return Result::Ok();
}

Result MemoryRepository::DeleteRemoteDocument(Transaction& t, const std::string& path) {
  TX(t).Mutable().remote_documents.erase(path);
  return Result::Ok();
}

std::optional<model::RemoteDocumentRecord> MemoryRepository::GetRemoteDocument(Transaction& t, const std::string& path) {
  const auto& s  = TX(t).View();
  auto        it = s.remote_documents.find(path);
  if (it == s.remote_documents.end()) return std::nullopt;
  return model::RemoteDocumentRecord{it->first, it->second};
}

std::vector<model::RemoteDocumentRecord> MemoryRepository::GetRemoteDocuments(Transaction& t, const std::vector<std::string>& paths) {
  if (paths.size() > max_parameters_) {
    throw util::StoreFailure(ErrorCode::Unsupported, "too many SQL variables: " + std::to_string(paths.size()) + " > " +
                                                         std::to_string(max_parameters_));
  }

  // IN (...) semantics: duplicates in the argument list yield one row.
  std::map<std::string, std::string> matched;
  const auto&                        s = TX(t).View();
  for (const auto& path : paths) {
    auto it = s.remote_documents.find(path);
    if (it != s.remote_documents.end()) matched.insert(*it);
  }

  std::vector<model::RemoteDocumentRecord> out;
  out.reserve(matched.size());
  for (auto& [path, contents] : matched) {
    out.push_back({path, contents});
  }
  return out;
}

std::vector<model::RemoteDocumentRecord> MemoryRepository::ScanRemoteDocuments(Transaction& t, const std::string& start,
                                                                               const std::optional<std::string>& end) {
  const auto& s     = TX(t).View();
  auto        first = s.remote_documents.lower_bound(start);
  auto        last  = end.has_value() ? s.remote_documents.lower_bound(*end) : s.remote_documents.end();

  std::vector<model::RemoteDocumentRecord> out;
  for (auto it = first; it != last && (!end.has_value() || it->first < *end); ++it) {
    out.push_back({it->first, it->second});
  }
  return out;
}

} // namespace doccache::db::memory
