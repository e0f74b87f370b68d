#pragma once

#include <cstdint>
#include <string>

namespace settle::db::model {

// Pending, not yet published, safe scan-back point for one chain.
struct WatermarkProposal {
  std::string  chain;
  std::int64_t value      = 0;
  std::int64_t created_at = 0;
};

// Last value published for one chain. Never decreases.
struct WatermarkRecord {
  std::string  chain;
  std::int64_t value        = 0;
  std::int64_t committed_at = 0;
};

} // namespace settle::db::model
