#pragma once

#include <cstdint>
#include <string>

namespace settle::db::model {

struct AttemptRecord {
  std::string   action_key;
  std::uint32_t count           = 0;
  std::int64_t  last_attempt_at = 0;
};

} // namespace settle::db::model
