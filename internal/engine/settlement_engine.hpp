#pragma once

#include <atomic>
#include <memory>
#include <mutex>

#include "internal/chain/ledger_adapter.hpp"
#include "internal/chain/watermark_publisher.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/engine/engine_options.hpp"
#include "internal/engine/pass_result.hpp"
#include "internal/engine/register_credit_flow.hpp"
#include "internal/engine/token_deposit_flow.hpp"
#include "internal/fees/backing_guard.hpp"
#include "internal/fees/fee_reconciler.hpp"
#include "internal/governor/attempt_governor.hpp"
#include "internal/reservation/reservation_manager.hpp"
#include "internal/store/deposit_store.hpp"
#include "internal/watermark/watermark_manager.hpp"

namespace settle::engine {

/*
  SettlementEngine

  Entry points for the poll scheduler. Passes never throw on per-item
  failures; every item runs in its own error boundary and the result
  counts what happened.

  At most one pass (detection or advancement) runs per direction at a
  time; a second caller gets a result with busy set. The two directions
  run independently.

  RequestStop() lets the current item finish, then ends the pass. The
  request holds for every later pass until ClearStop().
*/
class SettlementEngine {
 public:
  SettlementEngine(std::shared_ptr<db::Repository> repository, std::shared_ptr<chain::LedgerAdapter> token_ledger,
                   std::shared_ptr<chain::LedgerAdapter> register_ledger, std::shared_ptr<chain::WatermarkPublisher> publisher,
                   std::shared_ptr<const util::TimeSource> clock, EngineOptions options);

  // Startup: seeds watermarks from the published ones and clears
  // reservations left by a crashed holder once they expire.
  void Recover();

  DetectionResult RunDetectionPass(settle::model::ItemKind kind);

  PassResult RunAdvancementPass(settle::model::ItemKind kind);

  // Reservation sweep, watermark commit, fee summary rebuild, backing
  // check and the open-item report.
  MaintenanceResult RunMaintenance();

  void RequestStop();
  void ClearStop();
  bool StopRequested() const { return stop_requested_.load(); }

  store::DepositStore&             Store() { return *store_; }
  governor::AttemptGovernor&       Governor() { return *governor_; }
  reservation::ReservationManager& Reservations() { return *reservations_; }
  watermark::WatermarkManager&     Watermarks() { return *watermarks_; }
  fees::BackingGuard&              Backing() { return *backing_; }
  fees::FeeReconciler&             FeeLedger() { return *fee_reconciler_; }
  const EngineOptions&             Options() const { return options_; }

 private:
  DirectionFlow&        Flow(settle::model::ItemKind kind);
  std::mutex&           PassMutex(settle::model::ItemKind kind);
  chain::LedgerAdapter& SourceLedger(settle::model::ItemKind kind);

  // False when the item only deferred, was reserved elsewhere or is gone.
  bool ProcessItem(DirectionFlow& flow, const db::model::DepositRecord& listed, PassResult& result);

  std::shared_ptr<db::Repository>         repository_;
  std::shared_ptr<chain::LedgerAdapter>   token_ledger_;
  std::shared_ptr<chain::LedgerAdapter>   register_ledger_;
  std::shared_ptr<const util::TimeSource> clock_;
  EngineOptions                           options_;

  std::shared_ptr<store::DepositStore>             store_;
  std::shared_ptr<governor::AttemptGovernor>       governor_;
  std::shared_ptr<reservation::ReservationManager> reservations_;
  std::shared_ptr<watermark::WatermarkManager>     watermarks_;
  std::shared_ptr<fees::BackingGuard>              backing_;
  std::shared_ptr<fees::FeeReconciler>             fee_reconciler_;

  std::unique_ptr<TokenDepositFlow>   token_flow_;
  std::unique_ptr<RegisterCreditFlow> register_flow_;

  std::mutex        token_pass_mutex_;
  std::mutex        register_pass_mutex_;
  std::atomic<bool> stop_requested_{false};
};

} // namespace settle::engine
