#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>

#include "internal/db/api/repository.hpp"

namespace doccache::db::memory {

class MemoryTransaction;

/*
  Ordered in-memory store. Non-durable; used for tests and ephemeral caches.

  max_parameters emulates the host parameter ceiling so that callers see
  the same limits they would against SQLite.
*/
class MemoryRepository final : public db::Repository {
public:
  static constexpr std::size_t kDefaultMaxParameters = 999;

  explicit MemoryRepository(std::size_t max_parameters = kDefaultMaxParameters);

  std::unique_ptr<Transaction> Begin() override;

  std::size_t MaxParametersPerQuery() const override {
    return max_parameters_;
  }

  Result UpsertRemoteDocument(Transaction&, const model::RemoteDocumentRecord&) override;
  Result DeleteRemoteDocument(Transaction&, const std::string& path) override;
  std::optional<model::RemoteDocumentRecord> GetRemoteDocument(Transaction&, const std::string& path) override;
  std::vector<model::RemoteDocumentRecord> GetRemoteDocuments(Transaction&, const std::vector<std::string>& paths) override;
  std::vector<model::RemoteDocumentRecord> ScanRemoteDocuments(Transaction&, const std::string& start,
                                                               const std::optional<std::string>& end) override;

private:
  friend class MemoryTransaction;

  struct State {
    // path -> contents; std::string orders as unsigned bytes
    std::map<std::string, std::string> remote_documents;
  };

  const std::size_t max_parameters_;

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

}
