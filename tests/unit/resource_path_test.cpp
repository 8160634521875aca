#include "internal/model/resource_path.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/model/document_key.hpp"
#include "internal/model/query.hpp"
#include "internal/util/errors.hpp"

namespace {

using doccache::model::Document;
using doccache::model::DocumentKey;
using doccache::model::Query;
using doccache::model::ResourcePath;
using doccache::model::SnapshotVersion;
using doccache::util::InvalidArgument;

template <typename Fn>
bool ThrowsInvalidArgument(Fn&& fn) {
  try {
    fn();
  } catch (const InvalidArgument&) {
    return true;
  }
  return false;
}

void TestFromStringSplitsAndDropsEmptySegments() {
  auto path = ResourcePath::FromString("/rooms//abc/messages/");
  assert(path.length() == 3);
  assert(path[0] == "rooms");
  assert(path[1] == "abc");
  assert(path.LastSegment() == "messages");
  assert(path.CanonicalString() == "rooms/abc/messages");

  assert(ResourcePath::FromString("").empty());
}

void TestAppendAndPopLastDoNotMutate() {
  const ResourcePath rooms{"rooms"};
  const auto         doc = rooms.Append("a");
  assert(rooms.length() == 1);
  assert(doc.length() == 2);
  assert(doc.PopLast() == rooms);
  assert(ThrowsInvalidArgument([] { (void)ResourcePath().PopLast(); }));
}

void TestSegmentWiseOrdering() {
  assert((ResourcePath{"a"} < ResourcePath{"a", "b"}));
  assert((ResourcePath{"a", "z"} < ResourcePath{"ab"}));
  assert(ResourcePath{"a"} < ResourcePath{"b"});
  assert(!(ResourcePath{"b"} < ResourcePath{"b"}));
  // bytes compare unsigned
  assert(ResourcePath{"z"} < ResourcePath{"\xc3\xa9"});
  assert((ResourcePath{"rooms", "a"}.Compare(ResourcePath{"rooms", "a"}) == 0));
}

void TestPrefixRelations() {
  const ResourcePath rooms{"rooms"};
  assert(rooms.IsPrefixOf(ResourcePath{"rooms", "a"}));
  assert(rooms.IsPrefixOf(rooms));
  assert(!rooms.IsPrefixOf(ResourcePath{"roomsX", "a"}));
  assert(ResourcePath().IsPrefixOf(rooms));

  assert(rooms.IsImmediateParentOf(ResourcePath{"rooms", "a"}));
  assert(!rooms.IsImmediateParentOf(ResourcePath{"rooms", "a", "messages", "m1"}));
  assert(!rooms.IsImmediateParentOf(rooms));
}

void TestDocumentKeyRequiresEvenLength() {
  auto key = DocumentKey::FromPathString("rooms/a");
  assert(key.ToString() == "rooms/a");
  assert(key.CollectionPath() == ResourcePath{"rooms"});

  assert(ThrowsInvalidArgument([] { (void)DocumentKey::FromPathString("rooms"); }));
  assert(ThrowsInvalidArgument([] { (void)DocumentKey::FromPathString("rooms/a/messages"); }));
  assert(ThrowsInvalidArgument([] { (void)DocumentKey(ResourcePath()); }));
}

void TestDocumentKeyOrderFollowsPath() {
  assert(DocumentKey::FromPathString("rooms/a") < DocumentKey::FromPathString("rooms/a/messages/m1"));
  assert(DocumentKey::FromPathString("rooms/a/messages/m1") < DocumentKey::FromPathString("rooms/b"));
  assert(DocumentKey::FromPathString("rooms/a") == DocumentKey(ResourcePath{"rooms", "a"}));
}

void TestQueryRequiresCollectionPath() {
  assert(ThrowsInvalidArgument([] { (void)Query::AtPath(ResourcePath{"rooms", "a"}); }));
  assert(ThrowsInvalidArgument([] { (void)Query::AtPath(ResourcePath()); }));
}

void TestQueryMatchesImmediateChildrenAndFilter() {
  auto query = Query::AtPath(ResourcePath{"rooms"});

  Document direct{DocumentKey::FromPathString("rooms/a"), SnapshotVersion{1, 0}, "open"};
  Document nested{DocumentKey::FromPathString("rooms/a/messages/m1"), SnapshotVersion{1, 0}, "open"};
  Document other{DocumentKey::FromPathString("halls/a"), SnapshotVersion{1, 0}, "open"};

  assert(query.Matches(direct));
  assert(!query.Matches(nested));
  assert(!query.Matches(other));

  auto filtered = query.WithFilter([](const Document& doc) { return doc.data == "closed"; });
  assert(!filtered.Matches(direct));
  assert(filtered.path() == query.path());
}

} // namespace

int main() {
  TestFromStringSplitsAndDropsEmptySegments();
  TestAppendAndPopLastDoNotMutate();
  TestSegmentWiseOrdering();
  TestPrefixRelations();
  TestDocumentKeyRequiresEvenLength();
  TestDocumentKeyOrderFollowsPath();
  TestQueryRequiresCollectionPath();
  TestQueryMatchesImmediateChildrenAndFilter();

  std::cout << "doccache_unit_resource_path: pass\n";
  return 0;
}
