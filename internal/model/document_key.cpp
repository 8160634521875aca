#include "internal/model/document_key.hpp"

#include "internal/util/errors.hpp"

namespace doccache::model {

DocumentKey::DocumentKey(ResourcePath path) : path_(std::move(path)) {
  if (!IsDocumentKey(path_)) {
    throw util::InvalidArgument("document key: path must have an even, non-zero number of segments: '" + path_.CanonicalString() +
                                "' has " + std::to_string(path_.length()));
  }
}

DocumentKey DocumentKey::FromPathString(std::string_view path) {
  return DocumentKey(ResourcePath::FromString(path));
}

bool DocumentKey::IsDocumentKey(const ResourcePath& path) {
  return !path.empty() && path.length() % 2 == 0;
}

} // namespace doccache::model
