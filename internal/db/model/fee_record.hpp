#pragma once

#include <cstdint>
#include <string>

#include "internal/model/item.hpp"

namespace settle::db::model {

/*
  Append-only fee ledger row.

  The amount is booked in the column of the ledger the fee was taken
  on; the other column stays zero.
*/
struct FeeEntry {
  std::int64_t           id = 0; // assigned by the store
  std::string            source_ref;
  settle::model::FeeKind kind = settle::model::FeeKind::kFlat;

  std::uint64_t amount_token_units    = 0;
  std::uint64_t amount_register_units = 0;

  std::int64_t created_at = 0;
};

// Derived cache over fee_entries; rebuilt on every maintenance pass.
struct FeeSummary {
  std::uint64_t token_units_total    = 0;
  std::uint64_t register_units_total = 0;
  std::uint64_t entry_count          = 0;
  std::int64_t  refreshed_at         = 0;
};

} // namespace settle::db::model
