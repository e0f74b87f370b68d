#include "internal/engine/token_deposit_flow.hpp"

#include "internal/chain/memo.hpp"
#include "internal/observability/logging.hpp"

namespace settle::engine {

using settle::model::ItemKind;
using settle::model::ItemStatus;
using settle::model::Outcome;

TokenDepositFlow::TokenDepositFlow(FlowContext context) : DirectionFlow(ItemKind::kTokenDeposit, std::move(context)) {
}

Step TokenDepositFlow::AdvanceOwn(db::model::DepositRecord& record) {
  switch (record.status) {
    case ItemStatus::kDetected:
      return Validate(record);
    case ItemStatus::kReadyForProcessing:
      return Pay(record);
    case ItemStatus::kValueTransferred:
      return Confirm(record);
    default:
      SETTLE_LOG_ERROR("token deposit in foreign status", {observability::ItemField(record.id),
                                                           observability::StringField("status", settle::model::ToString(record.status))});
      return Step::Deferred();
  }
}

std::optional<std::uint64_t> TokenDepositFlow::PayoutUnits(const fees::FeeQuote& quote) const {
  return fees::ScaleUnits(quote.net, context_.options.token_ledger.decimals, context_.options.register_ledger.decimals);
}

DirectionFlow::TransferLeg TokenDepositFlow::PayoutLeg(const db::model::DepositRecord& record, std::uint64_t payout_units) {
  TransferLeg leg;
  leg.action           = "payout";
  leg.ledger           = context_.register_ledger.get();
  leg.request          = {record.destination, payout_units, chain::PayoutMemo(ItemKind::kTokenDeposit, record.id)};
  leg.max_attempts     = context_.options.max_attempts;
  leg.sent_status      = ItemStatus::kValueTransferred;
  leg.retry_status     = ItemStatus::kReadyForProcessing;
  leg.exhausted_status = ItemStatus::kToBeRefunded;
  return leg;
}

Step TokenDepositFlow::Validate(db::model::DepositRecord& record) {
  // fee policy first: micro deposits never reach a ledger call
  const auto quote = fees::QuotePayout(Fees(), record.amount_units);
  if (quote.fee_only) {
    return Forfeit(record, "below minimum deposit");
  }

  auto address = chain::ParseDestinationReference(record.memo, context_.options.destination_prefix);
  if (!address.has_value()) {
    return MoveTo(record, ItemStatus::kToBeRefunded, "malformed destination reference");
  }

  auto account = context_.register_ledger->LookupAccount(*address);
  if (!account.has_value()) {
    return MoveTo(record, ItemStatus::kToBeRefunded, "destination account not found");
  }
  if (account->asset != context_.options.register_ledger.asset) {
    return MoveTo(record, ItemStatus::kToBeRefunded, "destination account holds " + account->asset);
  }

  const auto payout = PayoutUnits(quote);
  if (!payout.has_value()) {
    return MoveTo(record, ItemStatus::kToBeRefunded, "amount out of range for destination ledger");
  }
  if (*payout == 0) {
    return Forfeit(record, "payout rounds to zero");
  }

  record.destination = *address;
  return MoveTo(record, ItemStatus::kReadyForProcessing, "");
}

Step TokenDepositFlow::Pay(db::model::DepositRecord& record) {
  if (context_.backing->PausesPayouts(ItemKind::kTokenDeposit)) {
    return Step::Deferred();
  }

  const auto quote  = fees::QuotePayout(Fees(), record.amount_units);
  const auto payout = PayoutUnits(quote);
  if (quote.fee_only || !payout.has_value() || *payout == 0) {
    // fee schedule changed since validation
    return MoveTo(record, ItemStatus::kToBeRefunded, "amount no longer payable under current fees");
  }

  return SubmitLeg(record, PayoutLeg(record, *payout));
}

Step TokenDepositFlow::Confirm(db::model::DepositRecord& record) {
  const auto quote  = fees::QuotePayout(Fees(), record.amount_units);
  const auto payout = PayoutUnits(quote).value_or(0);

  return AwaitLeg(record, PayoutLeg(record, payout), [&]() {
    store::Completion completion;
    completion.outcome      = Outcome::kProcessed;
    completion.payout_units = payout;
    completion.fee_units    = quote.TotalFee();
    completion.fees         = fees::PayoutFeeEntries(ItemKind::kTokenDeposit, record.id, quote);
    return Finish(record, completion);
  });
}

} // namespace settle::engine
