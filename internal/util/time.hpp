#pragma once

#include <chrono>
#include <cstdint>

#include "google/protobuf/timestamp.pb.h"

namespace flightrec::util {

/*
  Time utilities. Every clock read goes through Now() or NowMillis().
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

// Now() truncated to whole milliseconds, so that differences between two
// stored timestamps are exact in milliseconds.
TimePoint NowMillis();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

int64_t ToUnixMillis(TimePoint tp);
int64_t ToUnixMillis(const google::protobuf::Timestamp& ts);

bool Before(const google::protobuf::Timestamp& a, const google::protobuf::Timestamp& b);

} // namespace flightrec::util
