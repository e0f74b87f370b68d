#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "internal/fees/backing_guard.hpp"
#include "internal/fees/fee_policy.hpp"
#include "internal/watermark/watermark_manager.hpp"

namespace settle::engine {

struct LedgerOptions {
  std::string   name;
  std::string   asset;
  std::uint32_t decimals = 6;
  std::string   quarantine_account;
};

/*
  Plain settings for the engine and its flows, mapped from RuntimeConfig
  by the factory.
*/
struct EngineOptions {
  LedgerOptions token_ledger;
  LedgerOptions register_ledger;

  // In base units of the ledger each direction's deposits arrive on.
  fees::FeeSchedule token_deposit_fees;
  fees::FeeSchedule register_credit_fees;

  std::uint32_t max_attempts            = 3;
  std::int64_t  cooldown_seconds        = 300;
  std::uint32_t quarantine_max_attempts = 3;

  std::int64_t mapping_timeout_seconds      = 3600;
  std::int64_t confirmation_timeout_seconds = 1800;

  std::int64_t reservation_ttl_seconds = 300;
  std::string  holder                  = "swap-settlement";

  std::chrono::milliseconds pass_budget{30000};
  // Items a pass may work on; items that only defer are not counted.
  std::uint32_t max_items_per_pass = 100;
  // State-machine steps taken on one item within a pass.
  std::uint32_t max_steps_per_item = 8;

  fees::BackingOptions         backing;
  watermark::WatermarkOptions  watermark;
  std::string                  destination_prefix = "register";
};

} // namespace settle::engine
