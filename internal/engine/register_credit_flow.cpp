#include "internal/engine/register_credit_flow.hpp"

#include "internal/chain/memo.hpp"
#include "internal/observability/logging.hpp"

namespace settle::engine {

using settle::model::ItemKind;
using settle::model::ItemStatus;
using settle::model::Outcome;

RegisterCreditFlow::RegisterCreditFlow(FlowContext context) : DirectionFlow(ItemKind::kRegisterCredit, std::move(context)) {
}

Step RegisterCreditFlow::AdvanceOwn(db::model::DepositRecord& record) {
  switch (record.status) {
    case ItemStatus::kPendingMapping:
      return ResolveMapping(record);
    case ItemStatus::kReadyForProcessing:
      return Send(record);
    case ItemStatus::kSending:
      return RecoverSending(record);
    case ItemStatus::kAwaitingConfirmation:
      return Confirm(record);
    default:
      SETTLE_LOG_ERROR("register credit in foreign status", {observability::ItemField(record.id),
                                                             observability::StringField("status", settle::model::ToString(record.status))});
      return Step::Deferred();
  }
}

std::optional<std::uint64_t> RegisterCreditFlow::PayoutUnits(const fees::FeeQuote& quote) const {
  return fees::ScaleUnits(quote.net, context_.options.register_ledger.decimals, context_.options.token_ledger.decimals);
}

DirectionFlow::TransferLeg RegisterCreditFlow::PayoutLeg(const db::model::DepositRecord& record, std::uint64_t payout_units) {
  TransferLeg leg;
  leg.action           = "payout";
  leg.ledger           = context_.token_ledger.get();
  leg.request          = {record.destination, payout_units, chain::PayoutMemo(ItemKind::kRegisterCredit, record.id)};
  leg.max_attempts     = context_.options.max_attempts;
  leg.sent_status      = ItemStatus::kAwaitingConfirmation;
  leg.retry_status     = ItemStatus::kReadyForProcessing;
  leg.exhausted_status = ItemStatus::kRefundPending;
  return leg;
}

Step RegisterCreditFlow::ResolveMapping(db::model::DepositRecord& record) {
  const auto quote = fees::QuotePayout(Fees(), record.amount_units);
  if (quote.fee_only) {
    return Forfeit(record, "below minimum deposit");
  }

  auto mapping = context_.register_ledger->QueryMapping({record.id, record.owner});
  if (mapping.has_value() && (mapping->txid != record.id || mapping->owner != record.owner)) {
    SETTLE_LOG_WARN("mapping does not match credit; ignored", {observability::ItemField(record.id),
                                                               observability::StringField("mapping_txid", mapping->txid),
                                                               observability::StringField("mapping_owner", mapping->owner)});
    mapping.reset();
  }

  if (!mapping.has_value() || mapping->receival_address.empty()) {
    if (Elapsed(record.status_since, context_.options.mapping_timeout_seconds)) {
      return MoveTo(record, ItemStatus::kRefundPending, "no receival mapping before timeout");
    }
    return Step::Deferred();
  }

  auto account = context_.token_ledger->LookupAccount(mapping->receival_address);
  if (!account.has_value()) {
    return MoveTo(record, ItemStatus::kRefundPending, "receival account does not exist");
  }
  if (account->asset != context_.options.token_ledger.asset) {
    return MoveTo(record, ItemStatus::kRefundPending, "receival account holds " + account->asset);
  }

  const auto payout = PayoutUnits(quote);
  if (!payout.has_value()) {
    return MoveTo(record, ItemStatus::kRefundPending, "amount out of range for destination ledger");
  }
  if (*payout == 0) {
    return Forfeit(record, "payout rounds to zero");
  }

  record.destination = mapping->receival_address;
  return MoveTo(record, ItemStatus::kReadyForProcessing, "");
}

Step RegisterCreditFlow::Send(db::model::DepositRecord& record) {
  if (context_.backing->PausesPayouts(ItemKind::kRegisterCredit)) {
    return Step::Deferred();
  }

  const auto quote  = fees::QuotePayout(Fees(), record.amount_units);
  const auto payout = PayoutUnits(quote);
  if (quote.fee_only || !payout.has_value() || *payout == 0) {
    return MoveTo(record, ItemStatus::kRefundPending, "amount no longer payable under current fees");
  }

  const auto leg      = PayoutLeg(record, *payout);
  auto&      governor = *context_.governor;
  const auto key      = AttemptKey(leg.action, record);

  if (governor.Count(key) > 0) {
    auto existing = leg.ledger->FindOutgoingTransfer(leg.request.memo);
    if (existing.has_value() && *existing != record.transfer_id) {
      record.transfer_id = *existing;
      return MoveTo(record, ItemStatus::kSending, "recovered earlier payout transfer");
    }
  }

  if (!governor.ShouldAttempt(key, leg.max_attempts)) {
    if (governor.Exhausted(key, leg.max_attempts)) {
      return MoveTo(record, ItemStatus::kRefundPending, "payout attempts exhausted");
    }
    return Step::Deferred();
  }

  record.transfer_id.clear();
  MoveTo(record, ItemStatus::kSending, "");

  const auto count  = governor.RecordAttempt(key);
  const auto result = leg.ledger->SubmitTransfer(leg.request);

  switch (result.status) {
    case chain::SubmitStatus::kSubmitted:
      record.transfer_id = result.handle;
      return MoveTo(record, ItemStatus::kAwaitingConfirmation, "");

    case chain::SubmitStatus::kAmbiguous:
      record.note = "payout submission outcome unknown: " + result.message;
      record      = context_.store->Save(record);
      return Step::Deferred();

    case chain::SubmitStatus::kRejected:
    case chain::SubmitStatus::kTransient:
      break;
  }

  SETTLE_LOG_WARN("transfer submission failed", {observability::ItemField(record.id), observability::StringField("action", leg.action),
                                                 observability::IntField("attempt", count), observability::StringField("error", result.message)});
  if (count >= leg.max_attempts) {
    return MoveTo(record, ItemStatus::kRefundPending, "payout failed after " + std::to_string(count) + " attempts: " + result.message);
  }
  MoveTo(record, ItemStatus::kReadyForProcessing, "payout attempt failed: " + result.message);
  return Step::Deferred();
}

Step RegisterCreditFlow::RecoverSending(db::model::DepositRecord& record) {
  if (!record.transfer_id.empty()) {
    return MoveTo(record, ItemStatus::kAwaitingConfirmation, record.note);
  }

  const auto memo     = chain::PayoutMemo(ItemKind::kRegisterCredit, record.id);
  auto       existing = context_.token_ledger->FindOutgoingTransfer(memo);
  if (existing.has_value()) {
    record.transfer_id = *existing;
    return MoveTo(record, ItemStatus::kAwaitingConfirmation, "recovered payout transfer by memo");
  }

  if (!Elapsed(record.status_since, context_.options.cooldown_seconds)) {
    return Step::Deferred();
  }

  const auto key = AttemptKey("payout", record);
  if (context_.governor->Exhausted(key, context_.options.max_attempts)) {
    return MoveTo(record, ItemStatus::kNeedsReconciliation, "payout outcome unknown after final attempt; not found on ledger");
  }
  return MoveTo(record, ItemStatus::kReadyForProcessing, "payout not found on ledger");
}

Step RegisterCreditFlow::Confirm(db::model::DepositRecord& record) {
  const auto quote  = fees::QuotePayout(Fees(), record.amount_units);
  const auto payout = PayoutUnits(quote).value_or(0);

  return AwaitLeg(record, PayoutLeg(record, payout), [&]() {
    store::Completion completion;
    completion.outcome      = Outcome::kProcessed;
    completion.payout_units = payout;
    completion.fee_units    = quote.TotalFee();
    completion.fees         = fees::PayoutFeeEntries(ItemKind::kRegisterCredit, record.id, quote);
    return Finish(record, completion);
  });
}

} // namespace settle::engine
