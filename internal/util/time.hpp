#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "google/protobuf/timestamp.pb.h"

namespace artifact::util {

/*
  Time utilities. Single place to control the clock source.

  Version timestamps are kept as microseconds since the Unix epoch (UTC).
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

int64_t                     ToUnixMicros(TimePoint tp);
google::protobuf::Timestamp MicrosToProto(int64_t micros);
int64_t                     ProtoToMicros(const google::protobuf::Timestamp& ts);

// "2023-01-01T00:00:00.000000", no zone designator, always UTC
std::string FormatIso8601(int64_t micros);

// Accepts an optional fraction, a 'T' or ' ' separator and an optional
// 'Z' / +HH:MM / -HH:MM suffix. Values without a zone are read as UTC.
std::optional<int64_t> ParseIso8601(std::string_view text);

} // namespace artifact::util
