#include "internal/engine/settlement_engine.hpp"

#include <chrono>
#include <optional>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/errors.hpp"

namespace settle::engine {

using settle::model::ItemKind;
using settle::model::ItemStatus;
using settle::model::Outcome;

namespace {

constexpr const char* kItemReservation = "item";

constexpr ItemKind kDirections[] = {ItemKind::kTokenDeposit, ItemKind::kRegisterCredit};

std::string ReservationKey(const db::model::DepositRecord& record) {
  return std::string(settle::model::ToString(record.kind)) + ":" + record.id;
}

void Tally(PassResult& result, Outcome outcome) {
  switch (outcome) {
    case Outcome::kProcessed:
      ++result.processed;
      break;
    case Outcome::kFeeOnly:
      ++result.fee_only;
      break;
    case Outcome::kRefunded:
      ++result.refunded;
      break;
    case Outcome::kQuarantined:
      ++result.quarantined;
      break;
  }
}

void RecordPassMetrics(const PassResult& result) {
  auto&      metrics   = observability::Metrics::Instance();
  const auto direction = settle::model::ToString(result.kind);
  metrics.RecordPassItems(direction, "advanced", result.advanced);
  metrics.RecordPassItems(direction, "processed", result.processed);
  metrics.RecordPassItems(direction, "fee_only", result.fee_only);
  metrics.RecordPassItems(direction, "refunded", result.refunded);
  metrics.RecordPassItems(direction, "quarantined", result.quarantined);
  metrics.RecordPassItems(direction, "deferred", result.deferred);
  metrics.RecordPassItems(direction, "errored", result.errored);
  metrics.RecordPassItems(direction, "stuck", result.stuck);
  metrics.RecordPassItems(direction, "skipped", result.skipped);
}

} // namespace

SettlementEngine::SettlementEngine(std::shared_ptr<db::Repository> repository, std::shared_ptr<chain::LedgerAdapter> token_ledger,
                                   std::shared_ptr<chain::LedgerAdapter> register_ledger, std::shared_ptr<chain::WatermarkPublisher> publisher,
                                   std::shared_ptr<const util::TimeSource> clock, EngineOptions options)
    : repository_(std::move(repository)),
      token_ledger_(std::move(token_ledger)),
      register_ledger_(std::move(register_ledger)),
      clock_(std::move(clock)),
      options_(std::move(options)) {
  options_.backing.token_decimals    = options_.token_ledger.decimals;
  options_.backing.register_decimals = options_.register_ledger.decimals;

  store_          = std::make_shared<store::DepositStore>(repository_, clock_);
  governor_       = std::make_shared<governor::AttemptGovernor>(repository_, clock_, options_.cooldown_seconds);
  reservations_   = std::make_shared<reservation::ReservationManager>(repository_, clock_, options_.holder);
  watermarks_     = std::make_shared<watermark::WatermarkManager>(repository_, std::move(publisher), clock_, options_.watermark);
  backing_        = std::make_shared<fees::BackingGuard>(token_ledger_, register_ledger_, options_.backing);
  fee_reconciler_ = std::make_shared<fees::FeeReconciler>(repository_, clock_);

  FlowContext context{store_, governor_, backing_, token_ledger_, register_ledger_, clock_, options_};
  token_flow_    = std::make_unique<TokenDepositFlow>(context);
  register_flow_ = std::make_unique<RegisterCreditFlow>(context);
}

DirectionFlow& SettlementEngine::Flow(ItemKind kind) {
  if (kind == ItemKind::kTokenDeposit) return *token_flow_;
  return *register_flow_;
}

std::mutex& SettlementEngine::PassMutex(ItemKind kind) {
  return kind == ItemKind::kTokenDeposit ? token_pass_mutex_ : register_pass_mutex_;
}

chain::LedgerAdapter& SettlementEngine::SourceLedger(ItemKind kind) {
  return kind == ItemKind::kTokenDeposit ? *token_ledger_ : *register_ledger_;
}

void SettlementEngine::RequestStop() {
  if (!stop_requested_.exchange(true)) {
    SETTLE_LOG_INFO("settlement engine stop requested");
  }
}

void SettlementEngine::ClearStop() {
  if (stop_requested_.exchange(false)) {
    SETTLE_LOG_INFO("settlement engine stop cleared");
  }
}

void SettlementEngine::Recover() {
  watermarks_->Recover();
  reservations_->SweepExpired();

  for (auto kind : kDirections) {
    for (const auto& [status, count] : store_->CountByStatus(kind)) {
      SETTLE_LOG_INFO("open items at startup", {observability::StringField("kind", settle::model::ToString(kind)),
                                                observability::StringField("status", settle::model::ToString(status)),
                                                observability::UintField("count", count)});
    }
  }
}

// ------------------------------------------------------------------
// Detection
// ------------------------------------------------------------------

DetectionResult SettlementEngine::RunDetectionPass(ItemKind kind) {
  DetectionResult result;
  result.kind = kind;

  std::unique_lock lock(PassMutex(kind), std::try_to_lock);
  if (!lock.owns_lock()) {
    result.busy = true;
    return result;
  }

  const auto chain      = std::string(settle::model::SourceChain(kind));
  const auto pass_start = clock_->NowSeconds();

  std::vector<chain::RawEvent> events;
  try {
    events = SourceLedger(kind).FetchNewEvents(watermarks_->ScanFrom(chain));
  } catch (const std::exception& e) {
    ++result.errored;
    SETTLE_LOG_WARN("detection fetch failed", {observability::StringField("kind", settle::model::ToString(kind)),
                                               observability::ErrorField(e)});
    return result;
  }

  for (const auto& event : events) {
    ++result.scanned;
    if (event.id.empty()) {
      ++result.errored;
      SETTLE_LOG_WARN("event without transaction id ignored", {observability::StringField("kind", settle::model::ToString(kind))});
      continue;
    }

    db::model::DepositRecord record;
    record.id             = event.id;
    record.kind           = kind;
    record.detected_at    = event.timestamp;
    record.source_address = event.source_address;
    record.owner          = event.owner;
    record.amount_units   = event.amount_units;
    record.memo           = event.memo;

    try {
      switch (store_->RecordDetected(record)) {
        case store::DetectResult::kInserted:
          ++result.inserted;
          break;
        case store::DetectResult::kDuplicateOpen:
        case store::DetectResult::kAlreadyCompleted:
          ++result.duplicates;
          break;
      }
    } catch (const std::exception& e) {
      ++result.errored;
      SETTLE_LOG_ERROR("recording detected item failed",
                       {observability::ItemField(event.id), observability::ErrorField(e)});
    }
  }

  // a failed insert leaves the watermark where it was so the event is seen again
  if (result.errored == 0) {
    try {
      result.proposed_watermark = watermarks_->Propose(chain, store_->OldestOpen(kind), pass_start);
    } catch (const std::exception& e) {
      ++result.errored;
      SETTLE_LOG_ERROR("watermark proposal failed", {observability::StringField("chain", chain), observability::ErrorField(e)});
    }
  }

  if (result.inserted > 0 || result.errored > 0) {
    SETTLE_LOG_INFO("detection pass", {observability::StringField("kind", settle::model::ToString(kind)),
                                       observability::UintField("scanned", result.scanned), observability::UintField("inserted", result.inserted),
                                       observability::UintField("duplicates", result.duplicates),
                                       observability::UintField("errored", result.errored)});
  }
  return result;
}

// ------------------------------------------------------------------
// Advancement
// ------------------------------------------------------------------

PassResult SettlementEngine::RunAdvancementPass(ItemKind kind) {
  PassResult result;
  result.kind = kind;

  std::unique_lock lock(PassMutex(kind), std::try_to_lock);
  if (!lock.owns_lock()) {
    result.busy = true;
    return result;
  }

  const auto started = std::chrono::steady_clock::now();
  backing_->Evaluate();

  // items that only defer do not count against the cap; the listing pages
  // past them so newer items still get their turn
  const std::size_t                page_size = options_.max_items_per_pass;
  std::optional<store::ListCursor> cursor;
  std::uint64_t                    attempted = 0;
  bool                             halted    = false;

  auto& flow = Flow(kind);
  while (!halted) {
    std::vector<db::model::DepositRecord> items;
    try {
      items = store_->ListActionable(kind, {}, page_size, cursor);
    } catch (const std::exception& e) {
      ++result.errored;
      SETTLE_LOG_ERROR("listing open items failed",
                       {observability::StringField("kind", settle::model::ToString(kind)), observability::ErrorField(e)});
      break;
    }

    for (const auto& item : items) {
      if (stop_requested_.load()) {
        result.stopped = true;
        halted         = true;
        break;
      }
      if (std::chrono::steady_clock::now() - started >= options_.pass_budget) {
        result.budget_exhausted = true;
        halted                  = true;
        break;
      }
      if (page_size != 0 && attempted >= page_size) {
        halted = true;
        break;
      }
      ++result.scanned;
      if (ProcessItem(flow, item, result)) ++attempted;
      cursor = store::ListCursor{item.detected_at, item.id};
    }

    if (page_size == 0 || items.size() < page_size) break;
  }

  const auto elapsed_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
  observability::Metrics::Instance().ObservePassDurationMs(settle::model::ToString(kind), elapsed_ms);
  RecordPassMetrics(result);

  const bool eventful = result.advanced + result.processed + result.fee_only + result.refunded + result.quarantined + result.errored + result.stuck > 0;
  observability::Log(eventful || result.budget_exhausted ? spdlog::level::info : spdlog::level::debug, "advancement pass",
                     {observability::StringField("kind", settle::model::ToString(kind)), observability::UintField("scanned", result.scanned),
                      observability::UintField("advanced", result.advanced), observability::UintField("processed", result.processed),
                      observability::UintField("fee_only", result.fee_only), observability::UintField("refunded", result.refunded),
                      observability::UintField("quarantined", result.quarantined), observability::UintField("deferred", result.deferred),
                      observability::UintField("errored", result.errored), observability::UintField("stuck", result.stuck),
                      observability::UintField("skipped", result.skipped), observability::BoolField("budget_exhausted", result.budget_exhausted)});
  return result;
}

bool SettlementEngine::ProcessItem(DirectionFlow& flow, const db::model::DepositRecord& listed, PassResult& result) {
  try {
    reservation::ScopedReservation guard(*reservations_, kItemReservation, ReservationKey(listed), options_.reservation_ttl_seconds);
    if (!guard.Held()) {
      ++result.skipped;
      return false;
    }

    // re-read under the reservation; another worker may have moved it
    auto current = store_->Get(listed.kind, listed.id);
    if (!current.has_value()) {
      return false;
    }
    auto record = *current;

    bool moved = false;
    for (std::uint32_t steps = 0; steps < options_.max_steps_per_item; ++steps) {
      const auto step = flow.Advance(record);
      switch (step.kind) {
        case StepKind::kAdvanced:
          moved = true;
          continue;
        case StepKind::kDeferred:
          ++(moved ? result.advanced : result.deferred);
          return moved;
        case StepKind::kCompleted:
          Tally(result, step.outcome);
          return true;
        case StepKind::kParked:
          ++result.stuck;
          return true;
      }
    }
    ++result.advanced;
    return true;
  } catch (const util::InvalidState& e) {
    ++result.errored;
    SETTLE_LOG_WARN("item changed underneath pass", {observability::ItemField(listed.id), observability::ErrorField(e)});
  } catch (const std::exception& e) {
    ++result.errored;
    SETTLE_LOG_ERROR("item step failed", {observability::ItemField(listed.id),
                                          observability::StringField("kind", settle::model::ToString(listed.kind)),
                                          observability::StringField("status", settle::model::ToString(listed.status)),
                                          observability::ErrorField(e)});
  }
  return true;
}

// ------------------------------------------------------------------
// Maintenance
// ------------------------------------------------------------------

MaintenanceResult SettlementEngine::RunMaintenance() {
  MaintenanceResult result;

  try {
    result.reservations_swept = reservations_->SweepExpired();
  } catch (const std::exception& e) {
    ++result.errors;
    SETTLE_LOG_ERROR("reservation sweep failed", {observability::ErrorField(e)});
  }

  try {
    const auto commit          = watermarks_->Commit();
    result.watermark_committed = !commit.committed.empty();
    result.watermarks_clamped  = commit.clamped;
  } catch (const std::exception& e) {
    ++result.errors;
    SETTLE_LOG_ERROR("watermark commit failed", {observability::ErrorField(e)});
  }

  try {
    result.fee_summary = fee_reconciler_->Refresh();
  } catch (const std::exception& e) {
    ++result.errors;
    SETTLE_LOG_ERROR("fee summary refresh failed", {observability::ErrorField(e)});
  }

  result.backing = backing_->Evaluate();

  for (auto kind : kDirections) {
    try {
      result.open_counts[kind] = store_->CountByStatus(kind);

      const auto parked = store_->ListParked(kind);
      observability::Metrics::Instance().SetStuckItems(settle::model::ToString(kind), parked.size());
      for (const auto& record : parked) {
        ++result.stuck;
        SETTLE_LOG_ERROR("item awaiting operator action", {observability::ItemField(record.id),
                                                           observability::StringField("kind", settle::model::ToString(kind)),
                                                           observability::StringField("status", settle::model::ToString(record.status)),
                                                           observability::StringField("transfer_id", record.transfer_id),
                                                           observability::StringField("note", record.note)});
      }
    } catch (const std::exception& e) {
      ++result.errors;
      SETTLE_LOG_ERROR("open item report failed",
                       {observability::StringField("kind", settle::model::ToString(kind)), observability::ErrorField(e)});
    }
  }

  return result;
}

} // namespace settle::engine
