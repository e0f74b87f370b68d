#pragma once

#include <cstdint>
#include <string>

#include "internal/model/item.hpp"

namespace settle::db::model {

// Immutable audit row written when an item leaves the open table.
struct TerminalRecord {
  std::string             id;
  settle::model::ItemKind kind    = settle::model::ItemKind::kTokenDeposit;
  settle::model::Outcome  outcome = settle::model::Outcome::kProcessed;

  std::int64_t  detected_at = 0;
  std::string   source_address;
  std::uint64_t amount_units = 0;

  // Units that left a ledger (destination units for a payout, source
  // units for a refund or quarantine move).
  std::uint64_t payout_units = 0;
  // Fee retained, in source units.
  std::uint64_t fee_units = 0;

  std::string  destination;
  std::string  transfer_id;
  std::string  reason;
  std::int64_t completed_at = 0;
};

} // namespace settle::db::model
