#pragma once

#include <cstdint>
#include <functional>
#include <string>

#include "internal/engine/flow_context.hpp"

namespace settle::engine {

enum class StepKind {
  // The item changed state; another step may follow in the same pass.
  kAdvanced,
  // Waiting on a ledger, a cooldown or the backing guard.
  kDeferred,
  kCompleted,
  // Waiting on an operator.
  kParked,
};

struct Step {
  StepKind               kind    = StepKind::kDeferred;
  settle::model::Outcome outcome = settle::model::Outcome::kProcessed;

  static Step Advanced() { return {StepKind::kAdvanced}; }
  static Step Deferred() { return {StepKind::kDeferred}; }
  static Step Parked() { return {StepKind::kParked}; }
  static Step Completed(settle::model::Outcome outcome) { return {StepKind::kCompleted, outcome}; }
};

/*
  DirectionFlow

  One direction's state machine. Advance() takes exactly one step from
  the item's current status and persists it before returning; the
  record is updated in place.

  The refund and quarantine legs are shared: both return value to the
  source ledger the deposit came from. Subclasses drive validation and
  the payout leg.

  Every outgoing transfer follows the same order: check the governor,
  look for an earlier transfer carrying the same memo when a previous
  attempt exists, record the attempt, then submit.
*/
class DirectionFlow {
 public:
  DirectionFlow(settle::model::ItemKind kind, FlowContext context);
  virtual ~DirectionFlow() = default;

  DirectionFlow(const DirectionFlow&)            = delete;
  DirectionFlow& operator=(const DirectionFlow&) = delete;

  settle::model::ItemKind Kind() const { return kind_; }

  Step Advance(db::model::DepositRecord& record);

 protected:
  virtual Step AdvanceOwn(db::model::DepositRecord& record) = 0;

  // Status that starts the refund leg for this direction.
  virtual settle::model::ItemStatus RefundStatus() const = 0;

  chain::LedgerAdapter& SourceLedger() const;
  chain::LedgerAdapter& DestinationLedger() const;
  const LedgerOptions&  SourceLedgerOptions() const;
  const LedgerOptions&  DestinationLedgerOptions() const;
  const fees::FeeSchedule& Fees() const;

  std::string AttemptKey(std::string_view action, const db::model::DepositRecord& record) const;

  bool Elapsed(std::int64_t since, std::int64_t seconds) const;

  Step MoveTo(db::model::DepositRecord& record, settle::model::ItemStatus to, std::string note);

  Step Finish(db::model::DepositRecord& record, const store::Completion& completion);

  // Retains the whole amount as a micro_forfeit fee.
  Step Forfeit(db::model::DepositRecord& record, std::string reason);

  struct TransferLeg {
    std::string               action;
    chain::LedgerAdapter*     ledger = nullptr;
    chain::TransferRequest    request;
    std::uint32_t             max_attempts = 0;
    settle::model::ItemStatus sent_status;
    // Where the item goes after a failed attempt while attempts remain.
    settle::model::ItemStatus retry_status;
    settle::model::ItemStatus exhausted_status;
  };

  Step SubmitLeg(db::model::DepositRecord& record, const TransferLeg& leg);

  // Confirms record.transfer_id on leg.ledger. A missing handle is first
  // recovered by memo.
  Step AwaitLeg(db::model::DepositRecord& record, const TransferLeg& leg, const std::function<Step()>& on_confirmed);

  // Clears every attempt counter the item may have used.
  void ResetAttempts(const db::model::DepositRecord& record);

  FlowContext context_;

 private:
  Step AdvanceRefund(db::model::DepositRecord& record);
  Step AdvanceRefundSent(db::model::DepositRecord& record);
  Step AdvanceQuarantine(db::model::DepositRecord& record);
  Step AdvanceQuarantineSent(db::model::DepositRecord& record);

  TransferLeg RefundLeg(const db::model::DepositRecord& record, std::uint64_t net);
  TransferLeg QuarantineLeg(const db::model::DepositRecord& record, std::uint64_t net);

  settle::model::ItemKind kind_;
};

} // namespace settle::engine
