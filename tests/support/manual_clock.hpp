#pragma once

#include <atomic>
#include <cstdint>

#include "internal/util/time.hpp"

namespace settle::testing {

class ManualClock final : public util::TimeSource {
 public:
  explicit ManualClock(std::int64_t now = 1700000000) : now_(now) {
  }

  std::int64_t NowSeconds() const override {
    return now_.load();
  }

  void Set(std::int64_t now) {
    now_.store(now);
  }

  void Advance(std::int64_t seconds) {
    now_.fetch_add(seconds);
  }

 private:
  std::atomic<std::int64_t> now_;
};

} // namespace settle::testing
