#include "internal/fees/backing_guard.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"

namespace settle::fees {

namespace {

unsigned __int128 Widen(std::uint64_t units, std::uint32_t decimals, std::uint32_t target) {
  unsigned __int128 value = units;
  for (std::uint32_t i = decimals; i < target; ++i) value *= 10;
  return value;
}

} // namespace

BackingGuard::BackingGuard(std::shared_ptr<chain::LedgerAdapter> token_ledger, std::shared_ptr<chain::LedgerAdapter> register_ledger,
                           BackingOptions options)
    : token_ledger_(std::move(token_ledger)), register_ledger_(std::move(register_ledger)), options_(options) {
}

BackingSnapshot BackingGuard::Assess(std::uint64_t collateral_units, std::uint64_t liability_units, const BackingOptions& options) {
  BackingSnapshot snapshot;
  snapshot.collateral_units = collateral_units;
  snapshot.liability_units  = liability_units;

  if (liability_units == 0) {
    return snapshot;
  }

  const auto target     = std::max(options.token_decimals, options.register_decimals);
  const auto collateral = Widen(collateral_units, options.token_decimals, target);
  const auto liability  = Widen(liability_units, options.register_decimals, target);

  const unsigned __int128 ratio = collateral * 10000 / liability;
  snapshot.ratio_bps            = ratio > INT64_MAX ? INT64_MAX : static_cast<std::int64_t>(ratio);
  snapshot.paused               = options.pause_threshold_bps > 0 && collateral * 10000 < liability * options.pause_threshold_bps;
  return snapshot;
}

BackingSnapshot BackingGuard::Evaluate() {
  BackingSnapshot snapshot;
  try {
    snapshot = Assess(token_ledger_->CollateralBalance(), register_ledger_->CirculatingSupply(), options_);
  } catch (const std::exception& e) {
    snapshot.paused      = options_.pause_threshold_bps > 0;
    snapshot.unavailable = true;
    SETTLE_LOG_ERROR("backing check failed; payouts paused", {observability::ErrorField(e)});
  }

  std::optional<BackingSnapshot> previous;
  {
    std::lock_guard lock(mutex_);
    previous = last_;
    last_    = snapshot;
  }

  observability::Metrics::Instance().SetBackingRatioBps(snapshot.ratio_bps);

  const bool was_paused = previous.has_value() && previous->paused;
  if (snapshot.paused && !was_paused && !snapshot.unavailable) {
    SETTLE_LOG_ERROR("backing below threshold; payouts paused",
                     {observability::UintField("collateral_units", snapshot.collateral_units),
                      observability::UintField("liability_units", snapshot.liability_units), observability::IntField("ratio_bps", snapshot.ratio_bps),
                      observability::IntField("threshold_bps", options_.pause_threshold_bps)});
  } else if (!snapshot.paused && was_paused) {
    SETTLE_LOG_INFO("backing restored; payouts resumed", {observability::IntField("ratio_bps", snapshot.ratio_bps)});
  }
  return snapshot;
}

bool BackingGuard::PausesPayouts(settle::model::ItemKind kind) const {
  std::lock_guard lock(mutex_);
  const bool paused = last_.has_value() ? last_->paused : options_.pause_threshold_bps > 0;
  if (!paused) return false;
  return kind == settle::model::ItemKind::kTokenDeposit || options_.pause_redemptions;
}

std::optional<BackingSnapshot> BackingGuard::Last() const {
  std::lock_guard lock(mutex_);
  return last_;
}

} // namespace settle::fees
