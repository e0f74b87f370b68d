#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace settle::model {

/*
  Settlement direction.

  kTokenDeposit:   value arrives on the token ledger and is issued on the
                   register ledger.
  kRegisterCredit: value arrives on the register ledger and is paid out
                   from the token-ledger vault.
*/
enum class ItemKind : std::uint8_t {
  kTokenDeposit   = 0,
  kRegisterCredit = 1,
};

enum class ItemStatus : std::uint8_t {
  kDetected = 0,
  kPendingMapping,
  kReadyForProcessing,
  kValueTransferred,
  kSending,
  kAwaitingConfirmation,
  kToBeRefunded,
  kRefundPending,
  kRefundSent,
  kToBeQuarantined,
  kQuarantineSent,
  kQuarantineFailed,
  kNeedsReconciliation,
};

enum class Outcome : std::uint8_t {
  kProcessed = 0,
  kFeeOnly,
  kRefunded,
  kQuarantined,
};

enum class FeeKind : std::uint8_t {
  kFlat = 0,
  kDynamic,
  kMicroForfeit,
  kRefundFlat,
  kQuarantineFlat,
};

std::string_view ToString(ItemKind kind);
std::string_view ToString(ItemStatus status);
std::string_view ToString(Outcome outcome);
std::string_view ToString(FeeKind kind);

std::optional<ItemKind>   ParseItemKind(std::string_view text);
std::optional<ItemStatus> ParseItemStatus(std::string_view text);
std::optional<Outcome>    ParseOutcome(std::string_view text);
std::optional<FeeKind>    ParseFeeKind(std::string_view text);

// Watermark/chain key of the ledger the direction's deposits arrive on.
std::string_view SourceChain(ItemKind kind);

// First status of a freshly detected item.
constexpr ItemStatus InitialStatus(ItemKind kind) {
  return kind == ItemKind::kTokenDeposit ? ItemStatus::kDetected : ItemStatus::kPendingMapping;
}

} // namespace settle::model
