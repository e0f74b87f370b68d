#pragma once

#include <cstdint>
#include <string>

#include "internal/model/item.hpp"

namespace settle::db::model {

/*
  Open settlement item.

  One row per chain-native transaction identifier in the direction's
  open table. Mutated only by its direction's state machine, moved to
  the terminal table on completion.
*/
struct DepositRecord {
  std::string             id;
  settle::model::ItemKind kind = settle::model::ItemKind::kTokenDeposit;

  std::int64_t detected_at = 0;

  // Sending account on the source ledger and its verified owner.
  std::string source_address;
  std::string owner;

  // Integer base units of the source ledger.
  std::uint64_t amount_units = 0;
  std::string   memo;

  settle::model::ItemStatus status = settle::model::ItemStatus::kDetected;

  std::string destination;
  // Handle of the outgoing transfer currently in flight, if any.
  std::string transfer_id;
  // Reason recorded with the last transition.
  std::string note;

  // Time the item entered its current status.
  std::int64_t status_since = 0;
};

} // namespace settle::db::model
