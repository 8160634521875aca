#pragma once

#include <cstdint>
#include <string>
#include <variant>

#include "internal/model/document_key.hpp"
#include "internal/model/snapshot_version.hpp"

namespace doccache::model {

enum class DocumentState : std::uint8_t {
  kSynced             = 0,
  kLocalMutations     = 1,
  kCommittedMutations = 2,
};

// A document known to exist. `data` is the encoded field map, opaque here.
struct Document {
  DocumentKey     key;
  SnapshotVersion version;
  std::string     data;
  DocumentState   state = DocumentState::kSynced;

  bool HasPendingWrites() const {
    return state != DocumentState::kSynced;
  }

  friend bool operator==(const Document& lhs, const Document& rhs) {
    return lhs.key == rhs.key && lhs.version == rhs.version && lhs.data == rhs.data && lhs.state == rhs.state;
  }
};

// Tombstone: the document is known not to exist as of `version`.
struct NoDocument {
  DocumentKey     key;
  SnapshotVersion version;
  bool            has_committed_mutations = false;

  friend bool operator==(const NoDocument& lhs, const NoDocument& rhs) {
    return lhs.key == rhs.key && lhs.version == rhs.version && lhs.has_committed_mutations == rhs.has_committed_mutations;
  }
};

// Existence is pending resolution.
struct UnknownDocument {
  DocumentKey     key;
  SnapshotVersion version;

  friend bool operator==(const UnknownDocument& lhs, const UnknownDocument& rhs) {
    return lhs.key == rhs.key && lhs.version == rhs.version;
  }
};

using MaybeDocument = std::variant<Document, NoDocument, UnknownDocument>;

inline const DocumentKey& KeyOf(const MaybeDocument& doc) {
  return std::visit([](const auto& d) -> const DocumentKey& { return d.key; }, doc);
}

std::string DescribeVariant(const MaybeDocument& doc);

} // namespace doccache::model
