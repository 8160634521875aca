#pragma once

#include <functional>
#include <string>
#include <string_view>

#include "internal/model/resource_path.hpp"

namespace doccache::model {

/*
  Identity of a cached document: a ResourcePath of even, non-zero length.
*/
class DocumentKey {
 public:
  explicit DocumentKey(ResourcePath path);

  // "rooms/a" style path; throws util::InvalidArgument on odd length.
  static DocumentKey FromPathString(std::string_view path);
  static bool        IsDocumentKey(const ResourcePath& path);

  const ResourcePath& path() const {
    return path_;
  }

  ResourcePath CollectionPath() const {
    return path_.PopLast();
  }

  std::string ToString() const {
    return path_.CanonicalString();
  }

  friend bool operator==(const DocumentKey& lhs, const DocumentKey& rhs) {
    return lhs.path_ == rhs.path_;
  }
  friend bool operator!=(const DocumentKey& lhs, const DocumentKey& rhs) {
    return !(lhs == rhs);
  }
  friend bool operator<(const DocumentKey& lhs, const DocumentKey& rhs) {
    return lhs.path_ < rhs.path_;
  }

 private:
  ResourcePath path_;
};

} // namespace doccache::model
