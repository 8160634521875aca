#pragma once

#include <functional>

#include "internal/model/maybe_document.hpp"
#include "internal/model/resource_path.hpp"

namespace doccache::model {

/*
  Collection query evaluated in-process.

  The path must name a collection (odd segment count). The optional filter
  sees only the decoded Document; it knows nothing about storage encoding.
*/
class Query {
 public:
  using Filter = std::function<bool(const Document&)>;

  explicit Query(ResourcePath collection_path, Filter filter = {});

  static Query AtPath(ResourcePath collection_path) {
    return Query(std::move(collection_path));
  }

  Query WithFilter(Filter filter) const;

  const ResourcePath& path() const {
    return path_;
  }

  bool Matches(const Document& doc) const;

 private:
  ResourcePath path_;
  Filter       filter_;
};

} // namespace doccache::model
