#pragma once

#include "internal/model/item.hpp"

namespace settle::model {

// States that wait for an operator. No automated step leaves them.
constexpr bool IsParked(ItemStatus status) {
  return status == ItemStatus::kQuarantineFailed || status == ItemStatus::kNeedsReconciliation;
}

// States in which an outgoing transfer may have left a ledger.
constexpr bool HasTransferInFlight(ItemStatus status) {
  switch (status) {
    case ItemStatus::kValueTransferred:
    case ItemStatus::kSending:
    case ItemStatus::kAwaitingConfirmation:
    case ItemStatus::kRefundSent:
    case ItemStatus::kQuarantineSent:
      return true;
    default:
      return false;
  }
}

constexpr bool CanTransitionTokenDeposit(ItemStatus from, ItemStatus to) {
  switch (from) {
    case ItemStatus::kDetected:
      return to == ItemStatus::kReadyForProcessing || to == ItemStatus::kToBeRefunded;
    case ItemStatus::kReadyForProcessing:
      return to == ItemStatus::kValueTransferred || to == ItemStatus::kToBeRefunded;
    case ItemStatus::kValueTransferred:
      return to == ItemStatus::kReadyForProcessing || to == ItemStatus::kToBeRefunded || to == ItemStatus::kNeedsReconciliation;
    case ItemStatus::kToBeRefunded:
      return to == ItemStatus::kRefundSent || to == ItemStatus::kToBeQuarantined;
    case ItemStatus::kRefundSent:
      return to == ItemStatus::kToBeRefunded || to == ItemStatus::kToBeQuarantined || to == ItemStatus::kNeedsReconciliation;
    case ItemStatus::kToBeQuarantined:
      return to == ItemStatus::kQuarantineSent || to == ItemStatus::kQuarantineFailed;
    case ItemStatus::kQuarantineSent:
      return to == ItemStatus::kToBeQuarantined || to == ItemStatus::kQuarantineFailed || to == ItemStatus::kNeedsReconciliation;
    default:
      return false;
  }
}

constexpr bool CanTransitionRegisterCredit(ItemStatus from, ItemStatus to) {
  switch (from) {
    case ItemStatus::kPendingMapping:
      return to == ItemStatus::kReadyForProcessing || to == ItemStatus::kRefundPending;
    case ItemStatus::kReadyForProcessing:
      return to == ItemStatus::kSending || to == ItemStatus::kRefundPending;
    case ItemStatus::kSending:
      return to == ItemStatus::kAwaitingConfirmation || to == ItemStatus::kReadyForProcessing || to == ItemStatus::kRefundPending ||
             to == ItemStatus::kNeedsReconciliation;
    case ItemStatus::kAwaitingConfirmation:
      return to == ItemStatus::kReadyForProcessing || to == ItemStatus::kRefundPending || to == ItemStatus::kNeedsReconciliation;
    case ItemStatus::kRefundPending:
      return to == ItemStatus::kRefundSent || to == ItemStatus::kToBeQuarantined;
    case ItemStatus::kRefundSent:
      return to == ItemStatus::kRefundPending || to == ItemStatus::kToBeQuarantined || to == ItemStatus::kNeedsReconciliation;
    case ItemStatus::kToBeQuarantined:
      return to == ItemStatus::kQuarantineSent || to == ItemStatus::kQuarantineFailed;
    case ItemStatus::kQuarantineSent:
      return to == ItemStatus::kToBeQuarantined || to == ItemStatus::kQuarantineFailed || to == ItemStatus::kNeedsReconciliation;
    default:
      return false;
  }
}

constexpr bool CanTransition(ItemKind kind, ItemStatus from, ItemStatus to) {
  if (from == to) {
    return false;
  }
  return kind == ItemKind::kTokenDeposit ? CanTransitionTokenDeposit(from, to) : CanTransitionRegisterCredit(from, to);
}

// Whether an open item in `from` may move to the terminal table with `outcome`.
constexpr bool CanComplete(ItemKind kind, ItemStatus from, Outcome outcome) {
  switch (outcome) {
    case Outcome::kProcessed:
      return kind == ItemKind::kTokenDeposit ? from == ItemStatus::kValueTransferred : from == ItemStatus::kAwaitingConfirmation;
    case Outcome::kFeeOnly:
      return from == InitialStatus(kind) || from == ItemStatus::kToBeRefunded || from == ItemStatus::kRefundPending ||
             from == ItemStatus::kToBeQuarantined;
    case Outcome::kRefunded:
      return from == ItemStatus::kRefundSent;
    case Outcome::kQuarantined:
      return from == ItemStatus::kQuarantineSent;
  }
  return false;
}

} // namespace settle::model
