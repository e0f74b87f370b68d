#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace settle::chain {

/*
  A transfer into the vault observed on a ledger.

  id is the chain-native transaction identifier. owner is the verified
  identity behind source_address (wallet owner or signing genesis).
*/
struct RawEvent {
  std::string   id;
  std::int64_t  timestamp = 0;
  std::string   source_address;
  std::string   owner;
  std::uint64_t amount_units = 0;
  std::string   memo;
};

struct TransferRequest {
  std::string   destination;
  std::uint64_t amount_units = 0;
  // Idempotency marker searched by FindOutgoingTransfer.
  std::string memo;
};

enum class SubmitStatus {
  kSubmitted,
  // The ledger refused the transfer; nothing left the vault.
  kRejected,
  // Timeout or rate limit before the request reached the ledger.
  kTransient,
  // The call failed after the request may have been broadcast.
  kAmbiguous,
};

struct SubmitResult {
  SubmitStatus status = SubmitStatus::kRejected;
  std::string  handle;
  std::string  message;
};

enum class ConfirmStatus {
  kConfirmed,
  kPending,
  kFailed,
};

struct AccountInfo {
  std::string address;
  std::string asset;
  std::string owner;
  // False for accounts a transfer cannot be returned to (closed, frozen,
  // program owned).
  bool refundable = true;
};

struct MappingFilter {
  std::string txid;
  std::string owner;
};

struct MappingRecord {
  std::string txid;
  std::string owner;
  std::string receival_address;
};

/*
  LedgerAdapter

  Boundary to one ledger's RPC / CLI. Nothing here is exactly-once:
  FetchNewEvents may redeliver and SubmitTransfer may report failure for
  a transfer that landed. Implementations throw util::TransientError when
  a lookup times out; the engine retries on a later pass.
*/
class LedgerAdapter {
 public:
  virtual ~LedgerAdapter() = default;

  // Vault-bound transfers with timestamp >= since, oldest first.
  virtual std::vector<RawEvent> FetchNewEvents(std::int64_t since) = 0;

  virtual SubmitResult SubmitTransfer(const TransferRequest& request) = 0;

  virtual ConfirmStatus Confirm(const std::string& handle) = 0;

  virtual std::optional<AccountInfo> LookupAccount(const std::string& address) = 0;

  virtual std::optional<MappingRecord> QueryMapping(const MappingFilter& filter) = 0;

  // Most recent outgoing transfer carrying memo that the ledger has not
  // failed, if any.
  virtual std::optional<std::string> FindOutgoingTransfer(const std::string& memo) = 0;

  // Vault collateral in base units (token ledger).
  virtual std::uint64_t CollateralBalance() = 0;

  // Issued liability in base units (register ledger).
  virtual std::uint64_t CirculatingSupply() = 0;
};

} // namespace settle::chain
