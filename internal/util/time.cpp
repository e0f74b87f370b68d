#include "time.hpp"

namespace settle::util {

std::int64_t SystemTimeSource::NowSeconds() const {
  return ToUnixSeconds(Now());
}

TimePoint Now() {
  return Clock::now();
}

std::int64_t ToUnixSeconds(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

std::int64_t ToSeconds(const google::protobuf::Duration& d) {
  return d.seconds();
}

std::chrono::milliseconds ToMillis(const google::protobuf::Duration& d) {
  return std::chrono::milliseconds(d.seconds() * 1000 + d.nanos() / 1000000);
}

} // namespace settle::util
