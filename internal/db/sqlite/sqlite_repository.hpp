#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace settle::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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
  static SqliteTransaction& TX(Transaction&);
  static Result Translate(sqlite3* db, int rc);

  std::shared_ptr<SqliteDB> db_;
};

}
