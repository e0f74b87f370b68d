#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/attempt_record.hpp"
#include "internal/db/model/deposit_record.hpp"
#include "internal/db/model/fee_record.hpp"
#include "internal/db/model/reservation_record.hpp"
#include "internal/db/model/terminal_record.hpp"
#include "internal/db/model/watermark_record.hpp"

namespace settle::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes require a Transaction
  - Reads inside a transaction see its writes
  - Inserting an open or terminal item whose id already exists fails
    with AlreadyExists; rows are never silently replaced
  - Inserting a reservation whose (kind, key) already exists fails with
    AlreadyExists, expired or not; callers delete expired rows first

  The DB is the source of truth for:
    open and terminal settlement items
    reservations and attempt counters
    watermarks
    the fee ledger
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Open items (one table per direction)
  // ---------------------------------------------------------------------

  virtual Result InsertDeposit(Transaction&, const model::DepositRecord&) = 0;

  virtual std::optional<model::DepositRecord> GetDeposit(Transaction&, settle::model::ItemKind, const std::string& id) = 0;

  // Oldest first by (detected_at, id).
  virtual std::vector<model::DepositRecord> ListDeposits(Transaction&, settle::model::ItemKind) = 0;

  virtual Result UpdateDeposit(Transaction&, const model::DepositRecord&) = 0;

  virtual Result DeleteDeposit(Transaction&, settle::model::ItemKind, const std::string& id) = 0;

  virtual std::optional<std::int64_t> OldestDepositTime(Transaction&, settle::model::ItemKind) = 0;

  // ---------------------------------------------------------------------
  // Terminal items (audit trail, never deleted)
  // ---------------------------------------------------------------------

  virtual Result InsertTerminal(Transaction&, const model::TerminalRecord&) = 0;

  virtual std::optional<model::TerminalRecord> GetTerminal(Transaction&, settle::model::ItemKind, const std::string& id) = 0;

  virtual std::vector<model::TerminalRecord> ListTerminals(Transaction&, settle::model::ItemKind) = 0;

  // ---------------------------------------------------------------------
  // Reservations
  // ---------------------------------------------------------------------

  virtual Result InsertReservation(Transaction&, const model::ReservationRecord&) = 0;

  virtual std::optional<model::ReservationRecord> GetReservation(Transaction&, const std::string& kind, const std::string& key) = 0;

  virtual Result DeleteReservation(Transaction&, const std::string& kind, const std::string& key) = 0;

  // Removes every reservation with expires_at <= now.
  virtual Result DeleteExpiredReservations(Transaction&, std::int64_t now, std::uint64_t* removed) = 0;

  // ---------------------------------------------------------------------
  // Attempt counters
  // ---------------------------------------------------------------------

  virtual std::optional<model::AttemptRecord> GetAttempt(Transaction&, const std::string& action_key) = 0;

  virtual Result UpsertAttempt(Transaction&, const model::AttemptRecord&) = 0;

  virtual Result DeleteAttempt(Transaction&, const std::string& action_key) = 0;

  // ---------------------------------------------------------------------
  // Watermarks
  // ---------------------------------------------------------------------

  virtual Result UpsertWatermarkProposal(Transaction&, const model::WatermarkProposal&) = 0;

  virtual std::vector<model::WatermarkProposal> ListWatermarkProposals(Transaction&) = 0;

  virtual Result DeleteWatermarkProposal(Transaction&, const std::string& chain) = 0;

  virtual std::optional<model::WatermarkRecord> GetWatermark(Transaction&, const std::string& chain) = 0;

  virtual Result UpsertWatermark(Transaction&, const model::WatermarkRecord&) = 0;

  // ---------------------------------------------------------------------
  // Fee ledger
  // ---------------------------------------------------------------------

  virtual Result InsertFeeEntry(Transaction&, const model::FeeEntry&) = 0;

  // Ordered by id.
  virtual std::vector<model::FeeEntry> ListFeeEntries(Transaction&) = 0;

  virtual Result UpsertFeeSummary(Transaction&, const model::FeeSummary&) = 0;

  virtual std::optional<model::FeeSummary> GetFeeSummary(Transaction&) = 0;
};

} // namespace settle::db
