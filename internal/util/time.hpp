#pragma once

#include <chrono>
#include <cstdint>

#include "google/protobuf/duration.pb.h"
#include "google/protobuf/timestamp.pb.h"

namespace pulsetx::util {

/*
  Time utilities. Every clock read goes through Now().
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

// ledger block times are whole unix seconds
TimePoint    FromUnixSeconds(int64_t seconds);
int64_t      ToUnixSeconds(TimePoint tp);
uint64_t     ToUnixMillis(TimePoint tp);

std::chrono::milliseconds ToMillis(const google::protobuf::Duration& d);

} // namespace pulsetx::util
