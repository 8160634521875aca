#pragma once

#include <cstddef>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace doccache::model {

/*
  Immutable hierarchical path: collection/document/collection/document...

  Ordering is segment-wise; each segment compares as unsigned bytes.
*/
class ResourcePath {
 public:
  ResourcePath() = default;
  explicit ResourcePath(std::vector<std::string> segments);
  ResourcePath(std::initializer_list<std::string> segments);

  // Splits on '/' and drops empty segments.
  static ResourcePath FromString(std::string_view path);

  std::size_t length() const {
    return segments_.size();
  }
  bool empty() const {
    return segments_.empty();
  }

  const std::string& operator[](std::size_t index) const {
    return segments_[index];
  }
  const std::vector<std::string>& segments() const {
    return segments_;
  }

  const std::string& LastSegment() const;

  ResourcePath Append(std::string_view segment) const;
  ResourcePath PopLast() const;

  bool IsPrefixOf(const ResourcePath& other) const;
  bool IsImmediateParentOf(const ResourcePath& other) const;

  std::string CanonicalString() const;

  int Compare(const ResourcePath& other) const;

  friend bool operator==(const ResourcePath& lhs, const ResourcePath& rhs) {
    return lhs.segments_ == rhs.segments_;
  }
  friend bool operator!=(const ResourcePath& lhs, const ResourcePath& rhs) {
    return !(lhs == rhs);
  }
  friend bool operator<(const ResourcePath& lhs, const ResourcePath& rhs) {
    return lhs.Compare(rhs) < 0;
  }

 private:
  std::vector<std::string> segments_;
};

} // namespace doccache::model
