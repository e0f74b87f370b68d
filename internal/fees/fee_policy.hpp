#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/model/fee_record.hpp"
#include "internal/model/item.hpp"

namespace settle::fees {

// All amounts in base units of the ledger the deposit arrived on.
struct FeeSchedule {
  std::uint64_t flat_fee_units    = 0;
  std::uint32_t dynamic_fee_bps   = 0;
  std::uint64_t min_deposit_units = 0;
  std::uint64_t refund_fee_units  = 0;
};

struct FeeQuote {
  std::uint64_t gross       = 0;
  std::uint64_t flat_fee    = 0;
  std::uint64_t dynamic_fee = 0;
  std::uint64_t net         = 0;
  // The whole amount is retained; nothing is transferred.
  bool fee_only = false;

  std::uint64_t TotalFee() const { return gross - net; }
};

/*
  net = gross - flat - floor(gross * bps / 10000)

  Integer arithmetic throughout, truncating, never rounding up. A gross
  below min_deposit_units or a net of zero or less is fee_only.
*/
FeeQuote QuotePayout(const FeeSchedule& schedule, std::uint64_t gross);

// Refund and quarantine moves: net = gross - refund_fee_units.
FeeQuote QuoteReturn(const FeeSchedule& schedule, std::uint64_t gross);

/*
  Rescales base units from one ledger's decimals to another's. Narrowing
  truncates. nullopt when the result does not fit 64 bits.
*/
std::optional<std::uint64_t> ScaleUnits(std::uint64_t units, std::uint32_t from_decimals, std::uint32_t to_decimals);

// Builds a ledger entry with the amount booked against the item's source
// ledger column.
db::model::FeeEntry MakeFeeEntry(settle::model::ItemKind kind, const std::string& source_ref, settle::model::FeeKind fee_kind, std::uint64_t amount);

// Entries for a completed payout (flat and dynamic parts, zero parts
// omitted).
std::vector<db::model::FeeEntry> PayoutFeeEntries(settle::model::ItemKind kind, const std::string& source_ref, const FeeQuote& quote);

} // namespace settle::fees
