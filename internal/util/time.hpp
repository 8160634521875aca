#pragma once

#include <chrono>
#include <cstdint>

#include "google/protobuf/timestamp.pb.h"
#include "internal/model/snapshot_version.hpp"

namespace doccache::util {

/*
  Clock access and SnapshotVersion <-> Timestamp conversion.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

model::SnapshotVersion ToSnapshotVersion(TimePoint tp);

google::protobuf::Timestamp ToProto(const model::SnapshotVersion& version);
model::SnapshotVersion      FromProto(const google::protobuf::Timestamp& ts);

} // namespace doccache::util
