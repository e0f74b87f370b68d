#pragma once

#include <optional>

#include "internal/engine/direction_flow.hpp"

namespace settle::engine {

/*
  Token ledger deposit -> register ledger credit.

  detected -> ready_for_processing -> value_transferred -> processed

  The destination travels in the deposit memo as <prefix>:<address>. A
  malformed reference or a destination without an account of the
  expected asset goes straight to refund; validation is never retried.
*/
class TokenDepositFlow final : public DirectionFlow {
 public:
  explicit TokenDepositFlow(FlowContext context);

 protected:
  Step AdvanceOwn(db::model::DepositRecord& record) override;

  settle::model::ItemStatus RefundStatus() const override { return settle::model::ItemStatus::kToBeRefunded; }

 private:
  Step Validate(db::model::DepositRecord& record);
  Step Pay(db::model::DepositRecord& record);
  Step Confirm(db::model::DepositRecord& record);

  TransferLeg PayoutLeg(const db::model::DepositRecord& record, std::uint64_t payout_units);

  // Register-ledger units after fees; nullopt when out of range.
  std::optional<std::uint64_t> PayoutUnits(const fees::FeeQuote& quote) const;
};

} // namespace settle::engine
