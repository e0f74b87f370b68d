#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace settle::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertDeposit(Transaction&, const model::DepositRecord&) override;
  std::optional<model::DepositRecord> GetDeposit(Transaction&, settle::model::ItemKind, const std::string&) override;
  std::vector<model::DepositRecord> ListDeposits(Transaction&, settle::model::ItemKind) override;
  Result UpdateDeposit(Transaction&, const model::DepositRecord&) override;
  Result DeleteDeposit(Transaction&, settle::model::ItemKind, const std::string&) override;
  std::optional<std::int64_t> OldestDepositTime(Transaction&, settle::model::ItemKind) override;

  Result InsertTerminal(Transaction&, const model::TerminalRecord&) override;
  std::optional<model::TerminalRecord> GetTerminal(Transaction&, settle::model::ItemKind, const std::string&) override;
  std::vector<model::TerminalRecord> ListTerminals(Transaction&, settle::model::ItemKind) override;

  Result InsertReservation(Transaction&, const model::ReservationRecord&) override;
  std::optional<model::ReservationRecord> GetReservation(Transaction&, const std::string& kind,
                                                         const std::string& key) override;
  Result DeleteReservation(Transaction&, const std::string& kind, const std::string& key) override;
  Result DeleteExpiredReservations(Transaction&, std::int64_t now, std::uint64_t* removed) override;

  std::optional<model::AttemptRecord> GetAttempt(Transaction&, const std::string&) override;
  Result UpsertAttempt(Transaction&, const model::AttemptRecord&) override;
  Result DeleteAttempt(Transaction&, const std::string&) override;

  Result UpsertWatermarkProposal(Transaction&, const model::WatermarkProposal&) override;
  std::vector<model::WatermarkProposal> ListWatermarkProposals(Transaction&) override;
  Result DeleteWatermarkProposal(Transaction&, const std::string&) override;
  std::optional<model::WatermarkRecord> GetWatermark(Transaction&, const std::string&) override;
  Result UpsertWatermark(Transaction&, const model::WatermarkRecord&) override;

  Result InsertFeeEntry(Transaction&, const model::FeeEntry&) override;
  std::vector<model::FeeEntry> ListFeeEntries(Transaction&) override;
  Result UpsertFeeSummary(Transaction&, const model::FeeSummary&) override;
  std::optional<model::FeeSummary> GetFeeSummary(Transaction&) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::map<std::string, model::DepositRecord> token_deposits;
    std::map<std::string, model::DepositRecord> register_credits;
    std::map<std::string, model::TerminalRecord> token_deposits_done;
    std::map<std::string, model::TerminalRecord> register_credits_done;

    std::map<std::pair<std::string, std::string>, model::ReservationRecord> reservations;
    std::map<std::string, model::AttemptRecord> attempts;

    std::map<std::string, model::WatermarkProposal> watermark_proposals;
    std::map<std::string, model::WatermarkRecord> watermarks;

    std::vector<model::FeeEntry> fee_entries;
    std::int64_t next_fee_id = 1;
    std::optional<model::FeeSummary> fee_summary;
  };

  // Held by a live transaction for its whole lifetime.
  std::mutex tx_mutex_;

  std::mutex mutex_;
  State committed_;
  std::uint64_t committed_version_ = 0;
};

}
