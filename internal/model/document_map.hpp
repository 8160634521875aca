#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <optional>

#include "internal/model/document_key.hpp"
#include "internal/model/maybe_document.hpp"

namespace doccache::model {

/*
  Immutable ordered DocumentKey -> Document mapping.

  Built once from a fully populated std::map; copies share storage.
*/
class DocumentMap {
 public:
  using Storage        = std::map<DocumentKey, Document>;
  using const_iterator = Storage::const_iterator;

  DocumentMap() : entries_(std::make_shared<const Storage>()) {
  }
  explicit DocumentMap(Storage entries) : entries_(std::make_shared<const Storage>(std::move(entries))) {
  }

  std::size_t size() const {
    return entries_->size();
  }
  bool empty() const {
    return entries_->empty();
  }

  const_iterator begin() const {
    return entries_->begin();
  }
  const_iterator end() const {
    return entries_->end();
  }

  bool contains(const DocumentKey& key) const {
    return entries_->find(key) != entries_->end();
  }

  std::optional<Document> Get(const DocumentKey& key) const {
    auto it = entries_->find(key);
    if (it == entries_->end()) return std::nullopt;
    return it->second;
  }

 private:
  std::shared_ptr<const Storage> entries_;
};

} // namespace doccache::model
