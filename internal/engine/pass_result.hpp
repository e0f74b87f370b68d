#pragma once

#include <cstdint>
#include <map>
#include <optional>

#include "internal/db/model/fee_record.hpp"
#include "internal/fees/backing_guard.hpp"
#include "internal/model/item.hpp"

namespace settle::engine {

struct DetectionResult {
  settle::model::ItemKind kind = settle::model::ItemKind::kTokenDeposit;

  std::uint64_t scanned    = 0;
  std::uint64_t inserted   = 0;
  std::uint64_t duplicates = 0;
  std::uint64_t errored    = 0;

  std::optional<std::int64_t> proposed_watermark;
  // Another pass for the direction was running.
  bool busy = false;
};

struct PassResult {
  settle::model::ItemKind kind = settle::model::ItemKind::kTokenDeposit;

  std::uint64_t scanned     = 0;
  std::uint64_t advanced    = 0;
  std::uint64_t processed   = 0;
  std::uint64_t fee_only    = 0;
  std::uint64_t refunded    = 0;
  std::uint64_t quarantined = 0;
  std::uint64_t deferred    = 0;
  std::uint64_t errored     = 0;
  // Entered quarantine_failed or needs_reconciliation in this pass.
  std::uint64_t stuck = 0;
  // Reserved by another worker.
  std::uint64_t skipped = 0;

  bool budget_exhausted = false;
  bool stopped          = false;
  bool busy             = false;
};

struct MaintenanceResult {
  std::uint64_t reservations_swept  = 0;
  std::uint64_t watermarks_clamped  = 0;
  bool          watermark_committed = false;

  std::optional<db::model::FeeSummary> fee_summary;
  std::optional<fees::BackingSnapshot> backing;

  std::map<settle::model::ItemKind, std::map<settle::model::ItemStatus, std::uint64_t>> open_counts;
  std::uint64_t                                                                          stuck = 0;

  // Maintenance steps that failed; the rest still ran.
  std::uint64_t errors = 0;
};

} // namespace settle::engine
