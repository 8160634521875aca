#include "internal/encoding/encoded_path.hpp"

#include <cassert>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/resource_path.hpp"
#include "internal/util/errors.hpp"

namespace {

using doccache::encoding::EncodedPath;
using doccache::model::ResourcePath;

std::vector<ResourcePath> SamplePaths() {
  return {
      ResourcePath(),
      ResourcePath{"a"},
      ResourcePath{"a", "b"},
      ResourcePath{"a", "b", "c"},
      ResourcePath{"a", ""},
      ResourcePath{""},
      ResourcePath{"ab"},
      ResourcePath{"a", "b", "c", "d"},
      ResourcePath{"b"},
      ResourcePath{"rooms"},
      ResourcePath{"rooms", "abc"},
      ResourcePath{"rooms", "abc", "messages"},
      ResourcePath{"rooms", "abc", "messages", "xyz"},
      ResourcePath{"roomsX", "z"},
      ResourcePath{"room", "q"},
      ResourcePath{std::string("a\0", 2)},
      ResourcePath{std::string("a\0b", 3), "c"},
      ResourcePath{"a\x01"},
      ResourcePath{"a\x01", "b"},
      ResourcePath{"a\x02"},
      ResourcePath{"a\x10"},
      ResourcePath{"a\x11"},
      ResourcePath{"\x01\x01"},
      ResourcePath{"\xff"},
      ResourcePath{"\xff", "\xff"},
      ResourcePath{"a\xff"},
      ResourcePath{"\xc3\xa9t\xc3\xa9"},
      ResourcePath{"with/slash"},
  };
}

bool IsInRange(const std::string& encoded, const std::string& low, const std::optional<std::string>& high) {
  return low <= encoded && (!high.has_value() || encoded < *high);
}

void TestEmptyPathEncodesToEmptyString() {
  assert(EncodedPath::Encode(ResourcePath()).empty());
  assert(EncodedPath::Decode("").empty());
}

void TestEncodingEscapesSeparatorAndNul() {
  assert(EncodedPath::Encode(ResourcePath{"a"}) == std::string("a\x01\x01"));
  assert(EncodedPath::Encode(ResourcePath{"a", "b"}) == std::string("a\x01\x01" "b\x01\x01"));
  assert(EncodedPath::Encode(ResourcePath{std::string("\0", 1)}) == std::string("\x01\x10\x01\x01"));
  assert(EncodedPath::Encode(ResourcePath{"\x01"}) == std::string("\x01\x11\x01\x01"));
}

void TestRoundTrip() {
  for (const auto& path : SamplePaths()) {
    assert(EncodedPath::Decode(EncodedPath::Encode(path)) == path);
  }
}

void TestOrderIsPreserved() {
  const auto paths = SamplePaths();
  for (const auto& a : paths) {
    for (const auto& b : paths) {
      const auto ea = EncodedPath::Encode(a);
      const auto eb = EncodedPath::Encode(b);
      assert((a < b) == (ea < eb));
      assert((a == b) == (ea == eb));
    }
  }
}

void TestPrefixRangeContainsExactlyDescendants() {
  const auto paths = SamplePaths();
  for (const auto& p : paths) {
    const auto low  = EncodedPath::Encode(p);
    const auto high = EncodedPath::PrefixSuccessor(low);
    for (const auto& q : paths) {
      assert(p.IsPrefixOf(q) == IsInRange(EncodedPath::Encode(q), low, high));
    }
  }
}

void TestSiblingCollectionsFallOutsideRange() {
  const auto low  = EncodedPath::Encode(ResourcePath{"rooms"});
  const auto high = EncodedPath::PrefixSuccessor(low);
  assert(high.has_value());

  assert(IsInRange(EncodedPath::Encode(ResourcePath{"rooms", "a"}), low, high));
  assert(IsInRange(EncodedPath::Encode(ResourcePath{"rooms", "abc", "messages", "xyz"}), low, high));
  assert(!IsInRange(EncodedPath::Encode(ResourcePath{"roomsX", "a"}), low, high));
  assert(!IsInRange(EncodedPath::Encode(ResourcePath{"room", "a"}), low, high));
  assert(!IsInRange(EncodedPath::Encode(ResourcePath{"rooms\x01", "a"}), low, high));
}

void TestPrefixSuccessorIncrementsLastByte() {
  assert(EncodedPath::PrefixSuccessor("ab") == std::optional<std::string>("ac"));
  assert(EncodedPath::PrefixSuccessor(std::string("a\x01\x01")) == std::optional<std::string>(std::string("a\x01\x02")));
}

void TestPrefixSuccessorCarriesPastMaxByte() {
  assert(EncodedPath::PrefixSuccessor("a\xff") == std::optional<std::string>("b"));
  assert(EncodedPath::PrefixSuccessor("a\xff\xff") == std::optional<std::string>("b"));
  assert(EncodedPath::PrefixSuccessor(std::string("\x01\xff", 2)) == std::optional<std::string>(std::string("\x02")));

  // every key that starts with "a\xff" sorts below "b"
  assert(std::string("a\xff\xff\xff\x01") < *EncodedPath::PrefixSuccessor("a\xff"));
}

void TestPrefixSuccessorHasNoUpperBoundForEmptyOrMaxPrefix() {
  assert(!EncodedPath::PrefixSuccessor("").has_value());
  assert(!EncodedPath::PrefixSuccessor("\xff").has_value());
  assert(!EncodedPath::PrefixSuccessor("\xff\xff\xff").has_value());
}

void ExpectDecodeFailure(const std::string& encoded) {
  bool threw = false;
  try {
    (void)EncodedPath::Decode(encoded);
  } catch (const doccache::util::Corruption&) {
    threw = true;
  }
  assert(threw);
}

void TestDecodeRejectsMalformedKeys() {
  ExpectDecodeFailure("a");
  ExpectDecodeFailure(std::string("a\x01"));
  ExpectDecodeFailure(std::string("a\x01\x05\x01\x01"));
  ExpectDecodeFailure(std::string("a\x01\x01" "b"));
}

} // namespace

int main() {
  TestEmptyPathEncodesToEmptyString();
  TestEncodingEscapesSeparatorAndNul();
  TestRoundTrip();
  TestOrderIsPreserved();
  TestPrefixRangeContainsExactlyDescendants();
  TestSiblingCollectionsFallOutsideRange();
  TestPrefixSuccessorIncrementsLastByte();
  TestPrefixSuccessorCarriesPastMaxByte();
  TestPrefixSuccessorHasNoUpperBoundForEmptyOrMaxPrefix();
  TestDecodeRejectsMalformedKeys();

  std::cout << "doccache_unit_encoded_path: pass\n";
  return 0;
}
