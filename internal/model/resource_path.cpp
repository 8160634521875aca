#include "internal/model/resource_path.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace doccache::model {

ResourcePath::ResourcePath(std::vector<std::string> segments) : segments_(std::move(segments)) {
}

ResourcePath::ResourcePath(std::initializer_list<std::string> segments) : segments_(segments) {
}

ResourcePath ResourcePath::FromString(std::string_view path) {
  std::vector<std::string> segments;
  std::size_t              start = 0;
  while (start <= path.size()) {
    auto end = path.find('/', start);
    if (end == std::string_view::npos) end = path.size();
    if (end > start) segments.emplace_back(path.substr(start, end - start));
    start = end + 1;
  }
  return ResourcePath(std::move(segments));
}

const std::string& ResourcePath::LastSegment() const {
  if (segments_.empty()) {
    throw util::InvalidArgument("resource path: cannot take last segment of an empty path");
  }
  return segments_.back();
}

ResourcePath ResourcePath::Append(std::string_view segment) const {
  auto segments = segments_;
  segments.emplace_back(segment);
  return ResourcePath(std::move(segments));
}

ResourcePath ResourcePath::PopLast() const {
  if (segments_.empty()) {
    throw util::InvalidArgument("resource path: cannot pop from an empty path");
  }
  return ResourcePath(std::vector<std::string>(segments_.begin(), segments_.end() - 1));
}

bool ResourcePath::IsPrefixOf(const ResourcePath& other) const {
  if (length() > other.length()) return false;
  return std::equal(segments_.begin(), segments_.end(), other.segments_.begin());
}

bool ResourcePath::IsImmediateParentOf(const ResourcePath& other) const {
  return length() + 1 == other.length() && IsPrefixOf(other);
}

std::string ResourcePath::CanonicalString() const {
  std::string out;
  for (std::size_t i = 0; i < segments_.size(); ++i) {
    if (i > 0) out.push_back('/');
    out += segments_[i];
  }
  return out;
}

int ResourcePath::Compare(const ResourcePath& other) const {
  const auto common = std::min(length(), other.length());
  for (std::size_t i = 0; i < common; ++i) {
    // std::string compares through char_traits<char>, i.e. as unsigned bytes.
    const int c = segments_[i].compare(other.segments_[i]);
    if (c != 0) return c < 0 ? -1 : 1;
  }
  if (length() == other.length()) return 0;
  return length() < other.length() ? -1 : 1;
}

} // namespace doccache::model
