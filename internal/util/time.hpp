#pragma once

#include <chrono>
#include <cstdint>

#include "google/protobuf/duration.pb.h"

namespace settle::util {

/*
  Time utilities.

  Settlement timestamps are unix seconds. Components read the current
  time through TimeSource so tests can drive timeouts and cooldowns.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

class TimeSource {
 public:
  virtual ~TimeSource() = default;

  virtual std::int64_t NowSeconds() const = 0;
};

class SystemTimeSource final : public TimeSource {
 public:
  std::int64_t NowSeconds() const override;
};

TimePoint Now();

std::int64_t ToUnixSeconds(TimePoint tp);

// Zero when the duration is unset.
std::int64_t ToSeconds(const google::protobuf::Duration& d);
std::chrono::milliseconds ToMillis(const google::protobuf::Duration& d);

} // namespace settle::util
