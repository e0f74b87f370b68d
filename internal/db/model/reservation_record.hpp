#pragma once

#include <cstdint>
#include <string>

namespace settle::db::model {

struct ReservationRecord {
  std::string  kind;
  std::string  key;
  std::string  holder;
  std::int64_t expires_at = 0;
};

} // namespace settle::db::model
