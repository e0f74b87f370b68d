#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>

#include "internal/chain/ledger_adapter.hpp"
#include "internal/model/item.hpp"

namespace settle::fees {

struct BackingOptions {
  // Pause when collateral < threshold * liability. 0 disables the check.
  std::uint32_t pause_threshold_bps = 9000;
  // Also pause register-credit payouts (redemptions) while breached.
  bool pause_redemptions = false;

  std::uint32_t token_decimals    = 6;
  std::uint32_t register_decimals = 6;
};

struct BackingSnapshot {
  std::uint64_t collateral_units = 0;
  std::uint64_t liability_units  = 0;
  // collateral / liability in basis points after decimal alignment;
  // -1 when there is no liability.
  std::int64_t ratio_bps = -1;
  bool         paused    = false;
  // The ledgers could not be read; paused fails closed.
  bool unavailable = false;
};

/*
  BackingGuard

  Cross-cutting pause consulted before any new payout submission.
  Refunds, quarantine moves and confirmations are never paused.

  Until the first Evaluate() the guard reports paused.
*/
class BackingGuard {
 public:
  BackingGuard(std::shared_ptr<chain::LedgerAdapter> token_ledger, std::shared_ptr<chain::LedgerAdapter> register_ledger, BackingOptions options);

  static BackingSnapshot Assess(std::uint64_t collateral_units, std::uint64_t liability_units, const BackingOptions& options);

  // Reads both ledgers and stores the result.
  BackingSnapshot Evaluate();

  bool PausesPayouts(settle::model::ItemKind kind) const;

  std::optional<BackingSnapshot> Last() const;

 private:
  std::shared_ptr<chain::LedgerAdapter> token_ledger_;
  std::shared_ptr<chain::LedgerAdapter> register_ledger_;
  BackingOptions                        options_;

  mutable std::mutex             mutex_;
  std::optional<BackingSnapshot> last_;
};

} // namespace settle::fees
