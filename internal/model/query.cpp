#include "internal/model/query.hpp"

#include "internal/util/errors.hpp"

namespace doccache::model {

Query::Query(ResourcePath collection_path, Filter filter) : path_(std::move(collection_path)), filter_(std::move(filter)) {
  if (path_.length() % 2 == 0) {
    throw util::InvalidArgument("query: path must name a collection (odd number of segments): '" + path_.CanonicalString() + "'");
  }
}

Query Query::WithFilter(Filter filter) const {
  return Query(path_, std::move(filter));
}

bool Query::Matches(const Document& doc) const {
  if (!path_.IsImmediateParentOf(doc.key.path())) return false;
  return !filter_ || filter_(doc);
}

} // namespace doccache::model
