#pragma once

#include <optional>

#include "internal/engine/direction_flow.hpp"

namespace settle::engine {

/*
  Register ledger credit -> token ledger payout from the vault.

  pending_mapping -> ready_for_processing -> sending
    -> awaiting_confirmation -> processed

  The payout address comes from the mapping registry, matched on both
  the credit's txid and the depositor's verified identity. The engine
  never provisions the receiving account.

  sending is persisted before the transfer is submitted, so a crash in
  between is recovered by memo lookup instead of a blind resend.
*/
class RegisterCreditFlow final : public DirectionFlow {
 public:
  explicit RegisterCreditFlow(FlowContext context);

 protected:
  Step AdvanceOwn(db::model::DepositRecord& record) override;

  settle::model::ItemStatus RefundStatus() const override { return settle::model::ItemStatus::kRefundPending; }

 private:
  Step ResolveMapping(db::model::DepositRecord& record);
  Step Send(db::model::DepositRecord& record);
  Step RecoverSending(db::model::DepositRecord& record);
  Step Confirm(db::model::DepositRecord& record);

  TransferLeg PayoutLeg(const db::model::DepositRecord& record, std::uint64_t payout_units);

  std::optional<std::uint64_t> PayoutUnits(const fees::FeeQuote& quote) const;
};

} // namespace settle::engine
