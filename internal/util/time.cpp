#include "time.hpp"

namespace doccache::util {

TimePoint Now() {
  return Clock::now();
}

model::SnapshotVersion ToSnapshotVersion(TimePoint tp) {
  auto sec   = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - sec);
  if (nanos.count() < 0) {
    sec -= std::chrono::seconds(1);
    nanos += std::chrono::seconds(1);
  }
  return model::SnapshotVersion{sec.time_since_epoch().count(), static_cast<int32_t>(nanos.count())};
}

google::protobuf::Timestamp ToProto(const model::SnapshotVersion& version) {
  google::protobuf::Timestamp ts;
  ts.set_seconds(version.seconds);
  ts.set_nanos(version.nanos);
  return ts;
}

model::SnapshotVersion FromProto(const google::protobuf::Timestamp& ts) {
  return model::SnapshotVersion{ts.seconds(), ts.nanos()};
}

} // namespace doccache::util
