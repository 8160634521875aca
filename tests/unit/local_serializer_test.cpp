#include "internal/serializer/local_serializer.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using doccache::model::Document;
using doccache::model::DocumentKey;
using doccache::model::DocumentState;
using doccache::model::MaybeDocument;
using doccache::model::NoDocument;
using doccache::model::SnapshotVersion;
using doccache::model::UnknownDocument;
using doccache::serializer::LocalSerializer;
using doccache::util::Corruption;

bool DecodeIsCorrupt(const LocalSerializer& serializer, const std::string& bytes) {
  try {
    (void)serializer.Decode(bytes);
  } catch (const Corruption&) {
    return true;
  }
  return false;
}

void TestDocumentRoundTripKeepsDataAndState() {
  LocalSerializer serializer;

  const std::string data("\x00\x01" "binary\xff", 9);
  MaybeDocument     doc = Document{DocumentKey::FromPathString("rooms/a"), SnapshotVersion{1700000000, 123}, data, DocumentState::kLocalMutations};

  const auto decoded = serializer.Decode(serializer.Encode(doc));
  assert(decoded == doc);
  assert(std::get<Document>(decoded).data == data);
  assert(std::get<Document>(decoded).HasPendingWrites());
}

void TestTombstoneAndUnknownRoundTrip() {
  LocalSerializer serializer;

  MaybeDocument tombstone = NoDocument{DocumentKey::FromPathString("rooms/a/messages/m1"), SnapshotVersion{42, 0}, true};
  assert(serializer.Decode(serializer.Encode(tombstone)) == tombstone);

  MaybeDocument unknown = UnknownDocument{DocumentKey::FromPathString("rooms/b"), SnapshotVersion{7, 9}};
  const auto    decoded = serializer.Decode(serializer.Encode(unknown));
  assert(std::holds_alternative<UnknownDocument>(decoded));
  assert(decoded == unknown);
}

void TestEncodingIsDeterministic() {
  LocalSerializer serializer;
  MaybeDocument   doc = Document{DocumentKey::FromPathString("rooms/a"), SnapshotVersion{5, 6}, "payload"};
  assert(serializer.Encode(doc) == serializer.Encode(doc));
}

void TestKeySegmentsSurviveVerbatim() {
  LocalSerializer serializer;
  DocumentKey     key(doccache::model::ResourcePath{"coll", std::string("we/ird\0id", 9)});
  MaybeDocument   doc = NoDocument{key, SnapshotVersion{1, 0}};
  assert(doccache::model::KeyOf(serializer.Decode(serializer.Encode(doc))) == key);
}

void TestNonUtf8KeySegmentsRoundTrip() {
  LocalSerializer serializer;

  DocumentKey   key(doccache::model::ResourcePath{"rooms", "\xff"});
  MaybeDocument doc = Document{key, SnapshotVersion{1, 0}, "x"};
  assert(serializer.Decode(serializer.Encode(doc)) == doc);

  DocumentKey   mixed(doccache::model::ResourcePath{std::string("\xc3\x28", 2), std::string("\x01\x00\xff", 3)});
  MaybeDocument tombstone = NoDocument{mixed, SnapshotVersion{2, 0}};
  assert(serializer.Decode(serializer.Encode(tombstone)) == tombstone);
}

void TestGarbageIsCorruption() {
  LocalSerializer serializer;
  assert(DecodeIsCorrupt(serializer, std::string("\xff\xff\xff\xff", 4)));
  assert(DecodeIsCorrupt(serializer, std::string("\x12\x05" "ab", 4)));
}

void TestEmptyRecordIsCorruption() {
  LocalSerializer serializer;
  assert(DecodeIsCorrupt(serializer, std::string()));
}

void TestNonDocumentKeyIsCorruption() {
  LocalSerializer serializer;

  doccache::v1::MaybeDocument proto;
  auto*                       no_doc = proto.mutable_no_document();
  no_doc->mutable_key()->add_segments("rooms");
  assert(DecodeIsCorrupt(serializer, proto.SerializeAsString()));

  doccache::v1::MaybeDocument missing_key;
  missing_key.mutable_document()->set_fields("x");
  assert(DecodeIsCorrupt(serializer, missing_key.SerializeAsString()));
}

} // namespace

int main() {
  TestDocumentRoundTripKeepsDataAndState();
  TestTombstoneAndUnknownRoundTrip();
  TestEncodingIsDeterministic();
  TestKeySegmentsSurviveVerbatim();
  TestNonUtf8KeySegmentsRoundTrip();
  TestGarbageIsCorruption();
  TestEmptyRecordIsCorruption();
  TestNonDocumentKeyIsCorruption();

  std::cout << "doccache_unit_local_serializer: pass\n";
  return 0;
}
