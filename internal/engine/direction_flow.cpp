#include "internal/engine/direction_flow.hpp"

#include "internal/chain/memo.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"

namespace settle::engine {

using settle::model::FeeKind;
using settle::model::ItemKind;
using settle::model::ItemStatus;
using settle::model::Outcome;

DirectionFlow::DirectionFlow(ItemKind kind, FlowContext context) : context_(std::move(context)), kind_(kind) {
}

Step DirectionFlow::Advance(db::model::DepositRecord& record) {
  if (settle::model::IsParked(record.status)) {
    return Step::Parked();
  }

  switch (record.status) {
    case ItemStatus::kToBeRefunded:
    case ItemStatus::kRefundPending:
      return AdvanceRefund(record);
    case ItemStatus::kRefundSent:
      return AdvanceRefundSent(record);
    case ItemStatus::kToBeQuarantined:
      return AdvanceQuarantine(record);
    case ItemStatus::kQuarantineSent:
      return AdvanceQuarantineSent(record);
    default:
      return AdvanceOwn(record);
  }
}

chain::LedgerAdapter& DirectionFlow::SourceLedger() const {
  return kind_ == ItemKind::kTokenDeposit ? *context_.token_ledger : *context_.register_ledger;
}

chain::LedgerAdapter& DirectionFlow::DestinationLedger() const {
  return kind_ == ItemKind::kTokenDeposit ? *context_.register_ledger : *context_.token_ledger;
}

const LedgerOptions& DirectionFlow::SourceLedgerOptions() const {
  return kind_ == ItemKind::kTokenDeposit ? context_.options.token_ledger : context_.options.register_ledger;
}

const LedgerOptions& DirectionFlow::DestinationLedgerOptions() const {
  return kind_ == ItemKind::kTokenDeposit ? context_.options.register_ledger : context_.options.token_ledger;
}

const fees::FeeSchedule& DirectionFlow::Fees() const {
  return kind_ == ItemKind::kTokenDeposit ? context_.options.token_deposit_fees : context_.options.register_credit_fees;
}

std::string DirectionFlow::AttemptKey(std::string_view action, const db::model::DepositRecord& record) const {
  return governor::AttemptGovernor::Key(kind_, action, record.id);
}

bool DirectionFlow::Elapsed(std::int64_t since, std::int64_t seconds) const {
  return context_.clock->NowSeconds() - since >= seconds;
}

Step DirectionFlow::MoveTo(db::model::DepositRecord& record, ItemStatus to, std::string note) {
  record.note = std::move(note);
  record      = context_.store->Transition(record, to);
  return settle::model::IsParked(to) ? Step::Parked() : Step::Advanced();
}

Step DirectionFlow::Finish(db::model::DepositRecord& record, const store::Completion& completion) {
  context_.store->Complete(record, completion);
  ResetAttempts(record);
  return Step::Completed(completion.outcome);
}

Step DirectionFlow::Forfeit(db::model::DepositRecord& record, std::string reason) {
  store::Completion completion;
  completion.outcome   = Outcome::kFeeOnly;
  completion.fee_units = record.amount_units;
  completion.reason    = std::move(reason);
  if (record.amount_units > 0) {
    completion.fees.push_back(fees::MakeFeeEntry(kind_, record.id, FeeKind::kMicroForfeit, record.amount_units));
  }
  return Finish(record, completion);
}

void DirectionFlow::ResetAttempts(const db::model::DepositRecord& record) {
  for (const char* action : {"payout", "refund", "quarantine"}) {
    context_.governor->Reset(AttemptKey(action, record));
  }
}

// ------------------------------------------------------------------
// Transfer legs
// ------------------------------------------------------------------

Step DirectionFlow::SubmitLeg(db::model::DepositRecord& record, const TransferLeg& leg) {
  auto&      governor = *context_.governor;
  const auto key      = AttemptKey(leg.action, record);

  if (governor.Count(key) > 0) {
    // transfer_id still holds the last handle the ledger reported failed
    auto existing = leg.ledger->FindOutgoingTransfer(leg.request.memo);
    if (existing.has_value() && *existing != record.transfer_id) {
      SETTLE_LOG_WARN("recovered earlier transfer by memo", {observability::ItemField(record.id),
                                                             observability::StringField("memo", leg.request.memo),
                                                             observability::StringField("handle", *existing)});
      record.transfer_id = *existing;
      return MoveTo(record, leg.sent_status, "recovered earlier " + leg.action + " transfer");
    }
  }

  if (!governor.ShouldAttempt(key, leg.max_attempts)) {
    if (governor.Exhausted(key, leg.max_attempts)) {
      return MoveTo(record, leg.exhausted_status, leg.action + " attempts exhausted");
    }
    return Step::Deferred();
  }

  const auto count  = governor.RecordAttempt(key);
  const auto result = leg.ledger->SubmitTransfer(leg.request);

  switch (result.status) {
    case chain::SubmitStatus::kSubmitted:
      record.transfer_id = result.handle;
      return MoveTo(record, leg.sent_status, "");

    case chain::SubmitStatus::kAmbiguous:
      // resolved by memo lookup before anything is sent again
      record.transfer_id.clear();
      return MoveTo(record, leg.sent_status, leg.action + " submission outcome unknown: " + result.message);

    case chain::SubmitStatus::kRejected:
    case chain::SubmitStatus::kTransient:
      break;
  }

  SETTLE_LOG_WARN("transfer submission failed", {observability::ItemField(record.id),
                                                 observability::StringField("action", leg.action),
                                                 observability::IntField("attempt", count),
                                                 observability::StringField("error", result.message)});
  if (count >= leg.max_attempts) {
    return MoveTo(record, leg.exhausted_status, leg.action + " failed after " + std::to_string(count) + " attempts: " + result.message);
  }
  if (leg.retry_status != record.status) {
    return MoveTo(record, leg.retry_status, leg.action + " attempt failed: " + result.message);
  }
  record.note = leg.action + " attempt failed: " + result.message;
  record      = context_.store->Save(record);
  return Step::Deferred();
}

Step DirectionFlow::AwaitLeg(db::model::DepositRecord& record, const TransferLeg& leg, const std::function<Step()>& on_confirmed) {
  if (record.transfer_id.empty()) {
    auto existing = leg.ledger->FindOutgoingTransfer(leg.request.memo);
    if (!existing.has_value()) {
      if (!Elapsed(record.status_since, context_.options.cooldown_seconds)) {
        return Step::Deferred();
      }
      // the final attempt may still land; only an operator can tell
      if (context_.governor->Exhausted(AttemptKey(leg.action, record), leg.max_attempts)) {
        return MoveTo(record, ItemStatus::kNeedsReconciliation, leg.action + " outcome unknown after final attempt; not found on ledger");
      }
      return MoveTo(record, leg.retry_status, leg.action + " transfer not found on ledger");
    }
    record.transfer_id = *existing;
    record             = context_.store->Save(record);
  }

  switch (leg.ledger->Confirm(record.transfer_id)) {
    case chain::ConfirmStatus::kConfirmed:
      return on_confirmed();

    case chain::ConfirmStatus::kPending:
      if (Elapsed(record.status_since, context_.options.confirmation_timeout_seconds)) {
        return MoveTo(record, ItemStatus::kNeedsReconciliation, leg.action + " confirmation timed out for " + record.transfer_id);
      }
      return Step::Deferred();

    case chain::ConfirmStatus::kFailed:
      break;
  }

  // transfer_id keeps the failed handle; SubmitLeg ignores it on lookup
  const auto to = context_.governor->Exhausted(AttemptKey(leg.action, record), leg.max_attempts) ? leg.exhausted_status : leg.retry_status;
  return MoveTo(record, to, leg.action + " transfer failed on ledger");
}

// ------------------------------------------------------------------
// Refund and quarantine
// ------------------------------------------------------------------

DirectionFlow::TransferLeg DirectionFlow::RefundLeg(const db::model::DepositRecord& record, std::uint64_t net) {
  TransferLeg leg;
  leg.action           = "refund";
  leg.ledger           = &SourceLedger();
  leg.request          = {record.source_address, net, chain::RefundMemo(record.id)};
  leg.max_attempts     = context_.options.max_attempts;
  leg.sent_status      = ItemStatus::kRefundSent;
  leg.retry_status     = RefundStatus();
  leg.exhausted_status = ItemStatus::kToBeQuarantined;
  return leg;
}

DirectionFlow::TransferLeg DirectionFlow::QuarantineLeg(const db::model::DepositRecord& record, std::uint64_t net) {
  TransferLeg leg;
  leg.action           = "quarantine";
  leg.ledger           = &SourceLedger();
  leg.request          = {SourceLedgerOptions().quarantine_account, net, chain::QuarantineMemo(record.id)};
  leg.max_attempts     = context_.options.quarantine_max_attempts;
  leg.sent_status      = ItemStatus::kQuarantineSent;
  leg.retry_status     = ItemStatus::kToBeQuarantined;
  leg.exhausted_status = ItemStatus::kQuarantineFailed;
  return leg;
}

Step DirectionFlow::AdvanceRefund(db::model::DepositRecord& record) {
  const auto quote = fees::QuoteReturn(Fees(), record.amount_units);
  if (quote.fee_only) {
    return Forfeit(record, "amount does not cover refund fee");
  }

  auto account = SourceLedger().LookupAccount(record.source_address);
  if (!account.has_value() || !account->refundable) {
    return MoveTo(record, ItemStatus::kToBeQuarantined, "source account is not refundable");
  }

  return SubmitLeg(record, RefundLeg(record, quote.net));
}

Step DirectionFlow::AdvanceRefundSent(db::model::DepositRecord& record) {
  const auto quote = fees::QuoteReturn(Fees(), record.amount_units);
  return AwaitLeg(record, RefundLeg(record, quote.net), [&]() {
    store::Completion completion;
    completion.outcome      = Outcome::kRefunded;
    completion.payout_units = quote.net;
    completion.fee_units    = quote.TotalFee();
    completion.reason       = record.note;
    if (quote.flat_fee > 0) {
      completion.fees.push_back(fees::MakeFeeEntry(kind_, record.id, FeeKind::kRefundFlat, quote.flat_fee));
    }
    return Finish(record, completion);
  });
}

Step DirectionFlow::AdvanceQuarantine(db::model::DepositRecord& record) {
  const auto quote = fees::QuoteReturn(Fees(), record.amount_units);
  if (quote.fee_only) {
    return Forfeit(record, "amount does not cover quarantine fee");
  }

  if (SourceLedgerOptions().quarantine_account.empty()) {
    return MoveTo(record, ItemStatus::kQuarantineFailed, "no quarantine account configured");
  }

  return SubmitLeg(record, QuarantineLeg(record, quote.net));
}

Step DirectionFlow::AdvanceQuarantineSent(db::model::DepositRecord& record) {
  const auto quote = fees::QuoteReturn(Fees(), record.amount_units);
  return AwaitLeg(record, QuarantineLeg(record, quote.net), [&]() {
    store::Completion completion;
    completion.outcome      = Outcome::kQuarantined;
    completion.payout_units = quote.net;
    completion.fee_units    = quote.TotalFee();
    completion.reason       = record.note;
    if (quote.flat_fee > 0) {
      completion.fees.push_back(fees::MakeFeeEntry(kind_, record.id, FeeKind::kQuarantineFlat, quote.flat_fee));
    }
    return Finish(record, completion);
  });
}

} // namespace settle::engine
