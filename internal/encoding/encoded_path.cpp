#include "internal/encoding/encoded_path.hpp"

#include <vector>

#include "internal/util/errors.hpp"

namespace doccache::encoding {

namespace {

void EncodeSegment(const std::string& segment, std::string* out) {
  for (char c : segment) {
    switch (c) {
      case '\0':
        out->push_back(EncodedPath::kEscape);
        out->push_back(EncodedPath::kEncodedNul);
        break;
      case EncodedPath::kEscape:
        out->push_back(EncodedPath::kEscape);
        out->push_back(EncodedPath::kEncodedEscape);
        break;
      default:
        out->push_back(c);
    }
  }
  out->push_back(EncodedPath::kEscape);
  out->push_back(EncodedPath::kEncodedSeparator);
}

[[noreturn]] void ThrowInvalid(std::string_view encoded, const std::string& reason) {
  std::string hex;
  static constexpr char kHex[] = "0123456789abcdef";
  for (unsigned char c : encoded) {
    hex.push_back(kHex[c >> 4]);
    hex.push_back(kHex[c & 0x0F]);
  }
  throw util::Corruption("invalid encoded resource path (" + reason + "): " + hex);
}

} // namespace

std::string EncodedPath::Encode(const model::ResourcePath& path) {
  std::string out;
  for (const auto& segment : path.segments()) {
    EncodeSegment(segment, &out);
  }
  return out;
}

model::ResourcePath EncodedPath::Decode(std::string_view encoded) {
  std::vector<std::string> segments;
  std::string              current;

  for (std::size_t i = 0; i < encoded.size(); ++i) {
    const char c = encoded[i];
    if (c != kEscape) {
      current.push_back(c);
      continue;
    }

    if (i + 1 >= encoded.size()) {
      ThrowInvalid(encoded, "dangling escape");
    }

    switch (encoded[++i]) {
      case kEncodedSeparator:
        segments.push_back(std::move(current));
        current.clear();
        break;
      case kEncodedNul:
        current.push_back('\0');
        break;
      case kEncodedEscape:
        current.push_back(kEscape);
        break;
      default:
        ThrowInvalid(encoded, "unknown escape code");
    }
  }

  if (!current.empty()) {
    ThrowInvalid(encoded, "unterminated segment");
  }

  return model::ResourcePath(std::move(segments));
}

std::optional<std::string> EncodedPath::PrefixSuccessor(std::string_view prefix) {
  std::string successor(prefix);
  while (!successor.empty()) {
    auto& last = reinterpret_cast<unsigned char&>(successor.back());
    if (last != 0xFF) {
      ++last;
      return successor;
    }
    // 0xFF cannot be incremented; carry into the preceding byte.
    successor.pop_back();
  }
  return std::nullopt;
}

} // namespace doccache::encoding
