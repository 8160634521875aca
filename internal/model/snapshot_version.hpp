#pragma once

#include <cstdint>
#include <string>

namespace doccache::model {

/*
  Point in time at which a document state was observed (seconds + nanos).
*/
struct SnapshotVersion {
  int64_t seconds = 0;
  int32_t nanos   = 0;

  static constexpr SnapshotVersion None() {
    return {};
  }

  std::string ToString() const {
    return "SnapshotVersion(seconds=" + std::to_string(seconds) + ", nanos=" + std::to_string(nanos) + ")";
  }

  friend bool operator==(const SnapshotVersion& lhs, const SnapshotVersion& rhs) {
    return lhs.seconds == rhs.seconds && lhs.nanos == rhs.nanos;
  }
  friend bool operator!=(const SnapshotVersion& lhs, const SnapshotVersion& rhs) {
    return !(lhs == rhs);
  }
  friend bool operator<(const SnapshotVersion& lhs, const SnapshotVersion& rhs) {
    return lhs.seconds != rhs.seconds ? lhs.seconds < rhs.seconds : lhs.nanos < rhs.nanos;
  }
};

} // namespace doccache::model
