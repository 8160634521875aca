#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "internal/model/resource_path.hpp"

namespace doccache::encoding {

/*
  Flat, order-preserving key encoding for ResourcePaths.

  Every segment is written with its 0x00/0x01 bytes escaped, followed by the
  two-byte separator 0x01 0x01:

    0x00 -> 0x01 0x10
    0x01 -> 0x01 0x11
    end  -> 0x01 0x01

  All content bytes that reach the output unescaped are >= 0x02, so the
  separator sorts below any continuation of a segment. As a result:

    - Encode(a) < Encode(b)  <=>  a < b (segment-wise)
    - Encode(a) is a byte prefix of Encode(b)  <=>  a is a prefix of b

  which lets an ordered store answer "everything under P" with the single
  half-open range [Encode(P), PrefixSuccessor(Encode(P))).
*/
class EncodedPath {
 public:
  static constexpr char kEscape           = '\x01';
  static constexpr char kEncodedSeparator = '\x01';
  static constexpr char kEncodedNul       = '\x10';
  static constexpr char kEncodedEscape    = '\x11';

  static std::string Encode(const model::ResourcePath& path);

  // Throws util::Corruption if `encoded` was not produced by Encode().
  static model::ResourcePath Decode(std::string_view encoded);

  // Smallest key greater than every key starting with `prefix`, or nullopt
  // when no such key exists (empty prefix, or all bytes 0xFF).
  static std::optional<std::string> PrefixSuccessor(std::string_view prefix);
};

} // namespace doccache::encoding
