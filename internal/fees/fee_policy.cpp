#include "internal/fees/fee_policy.hpp"

namespace settle::fees {

using settle::model::FeeKind;
using settle::model::ItemKind;

namespace {

FeeQuote AllFee(std::uint64_t gross) {
  FeeQuote quote;
  quote.gross    = gross;
  quote.net      = 0;
  quote.fee_only = true;
  return quote;
}

} // namespace

FeeQuote QuotePayout(const FeeSchedule& schedule, std::uint64_t gross) {
  if (gross == 0 || gross < schedule.min_deposit_units) {
    return AllFee(gross);
  }

  const auto dynamic = static_cast<std::uint64_t>(static_cast<unsigned __int128>(gross) * schedule.dynamic_fee_bps / 10000);
  const auto fees    = static_cast<unsigned __int128>(schedule.flat_fee_units) + dynamic;
  if (fees >= gross) {
    return AllFee(gross);
  }

  FeeQuote quote;
  quote.gross       = gross;
  quote.flat_fee    = schedule.flat_fee_units;
  quote.dynamic_fee = dynamic;
  quote.net         = gross - static_cast<std::uint64_t>(fees);
  return quote;
}

FeeQuote QuoteReturn(const FeeSchedule& schedule, std::uint64_t gross) {
  if (gross <= schedule.refund_fee_units) {
    return AllFee(gross);
  }

  FeeQuote quote;
  quote.gross    = gross;
  quote.flat_fee = schedule.refund_fee_units;
  quote.net      = gross - schedule.refund_fee_units;
  return quote;
}

std::optional<std::uint64_t> ScaleUnits(std::uint64_t units, std::uint32_t from_decimals, std::uint32_t to_decimals) {
  unsigned __int128 value = units;
  if (to_decimals >= from_decimals) {
    for (std::uint32_t i = from_decimals; i < to_decimals; ++i) {
      value *= 10;
      if (value > UINT64_MAX) return std::nullopt;
    }
  } else {
    for (std::uint32_t i = to_decimals; i < from_decimals; ++i) {
      value /= 10;
    }
  }
  return static_cast<std::uint64_t>(value);
}

db::model::FeeEntry MakeFeeEntry(ItemKind kind, const std::string& source_ref, FeeKind fee_kind, std::uint64_t amount) {
  db::model::FeeEntry entry;
  entry.source_ref = source_ref;
  entry.kind       = fee_kind;
  if (kind == ItemKind::kTokenDeposit) {
    entry.amount_token_units = amount;
  } else {
    entry.amount_register_units = amount;
  }
  return entry;
}

std::vector<db::model::FeeEntry> PayoutFeeEntries(ItemKind kind, const std::string& source_ref, const FeeQuote& quote) {
  std::vector<db::model::FeeEntry> entries;
  if (quote.flat_fee > 0) entries.push_back(MakeFeeEntry(kind, source_ref, FeeKind::kFlat, quote.flat_fee));
  if (quote.dynamic_fee > 0) entries.push_back(MakeFeeEntry(kind, source_ref, FeeKind::kDynamic, quote.dynamic_fee));
  return entries;
}

} // namespace settle::fees
