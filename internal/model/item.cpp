#include "item.hpp"

#include <array>
#include <utility>

namespace settle::model {
namespace {

constexpr std::array<std::pair<ItemStatus, std::string_view>, 13> kStatusNames = {{
    {ItemStatus::kDetected, "detected"},
    {ItemStatus::kPendingMapping, "pending_mapping"},
    {ItemStatus::kReadyForProcessing, "ready_for_processing"},
    {ItemStatus::kValueTransferred, "value_transferred"},
    {ItemStatus::kSending, "sending"},
    {ItemStatus::kAwaitingConfirmation, "awaiting_confirmation"},
    {ItemStatus::kToBeRefunded, "to_be_refunded"},
    {ItemStatus::kRefundPending, "refund_pending"},
    {ItemStatus::kRefundSent, "refund_sent"},
    {ItemStatus::kToBeQuarantined, "to_be_quarantined"},
    {ItemStatus::kQuarantineSent, "quarantine_sent"},
    {ItemStatus::kQuarantineFailed, "quarantine_failed"},
    {ItemStatus::kNeedsReconciliation, "needs_reconciliation"},
}};

constexpr std::array<std::pair<Outcome, std::string_view>, 4> kOutcomeNames = {{
    {Outcome::kProcessed, "processed"},
    {Outcome::kFeeOnly, "fee_only"},
    {Outcome::kRefunded, "refunded"},
    {Outcome::kQuarantined, "quarantined"},
}};

constexpr std::array<std::pair<FeeKind, std::string_view>, 5> kFeeKindNames = {{
    {FeeKind::kFlat, "flat"},
    {FeeKind::kDynamic, "dynamic"},
    {FeeKind::kMicroForfeit, "micro_forfeit"},
    {FeeKind::kRefundFlat, "refund_flat"},
    {FeeKind::kQuarantineFlat, "quarantine_flat"},
}};

template <typename Enum, std::size_t N>
std::string_view NameOf(const std::array<std::pair<Enum, std::string_view>, N>& names, Enum value) {
  for (const auto& [candidate, name] : names) {
    if (candidate == value) {
      return name;
    }
  }
  return "unknown";
}

template <typename Enum, std::size_t N>
std::optional<Enum> ValueOf(const std::array<std::pair<Enum, std::string_view>, N>& names, std::string_view text) {
  for (const auto& [candidate, name] : names) {
    if (name == text) {
      return candidate;
    }
  }
  return std::nullopt;
}

} // namespace

std::string_view ToString(ItemKind kind) {
  return kind == ItemKind::kTokenDeposit ? "token_deposit" : "register_credit";
}

std::string_view ToString(ItemStatus status) {
  return NameOf(kStatusNames, status);
}

std::string_view ToString(Outcome outcome) {
  return NameOf(kOutcomeNames, outcome);
}

std::string_view ToString(FeeKind kind) {
  return NameOf(kFeeKindNames, kind);
}

std::optional<ItemKind> ParseItemKind(std::string_view text) {
  if (text == "token_deposit") return ItemKind::kTokenDeposit;
  if (text == "register_credit") return ItemKind::kRegisterCredit;
  return std::nullopt;
}

std::optional<ItemStatus> ParseItemStatus(std::string_view text) {
  return ValueOf(kStatusNames, text);
}

std::optional<Outcome> ParseOutcome(std::string_view text) {
  return ValueOf(kOutcomeNames, text);
}

std::optional<FeeKind> ParseFeeKind(std::string_view text) {
  return ValueOf(kFeeKindNames, text);
}

std::string_view SourceChain(ItemKind kind) {
  return kind == ItemKind::kTokenDeposit ? "token" : "register";
}

} // namespace settle::model
