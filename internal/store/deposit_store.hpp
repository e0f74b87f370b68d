#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace settle::store {

enum class DetectResult {
  kInserted,
  kDuplicateOpen,
  kAlreadyCompleted,
};

struct Completion {
  settle::model::Outcome outcome = settle::model::Outcome::kProcessed;

  std::uint64_t payout_units = 0;
  std::uint64_t fee_units    = 0;
  std::string   reason;

  std::vector<db::model::FeeEntry> fees;
};

// Position in the (detected_at, id) listing order.
struct ListCursor {
  std::int64_t detected_at = 0;
  std::string  id;
};

/*
  DepositStore

  Item lifecycle on top of Repository. Every call runs in its own
  transaction.

  Writes are compare-and-set on status: the caller passes the record as
  it last read it, and the write fails with util::InvalidState if the
  stored status moved in between or the state machine forbids the step.
*/
class DepositStore {
 public:
  DepositStore(std::shared_ptr<db::Repository> repository, std::shared_ptr<const util::TimeSource> clock);

  // Idempotent against both the open and the terminal table.
  DetectResult RecordDetected(const db::model::DepositRecord& record);

  std::optional<db::model::DepositRecord>  Get(settle::model::ItemKind kind, const std::string& id);
  std::optional<db::model::TerminalRecord> GetTerminal(settle::model::ItemKind kind, const std::string& id);

  // Oldest first. Empty statuses selects every status that is not parked;
  // limit 0 means no limit. With `after`, only records strictly past that
  // position are returned.
  std::vector<db::model::DepositRecord> ListActionable(settle::model::ItemKind kind, const std::vector<settle::model::ItemStatus>& statuses = {},
                                                       std::size_t limit = 0, const std::optional<ListCursor>& after = std::nullopt);

  std::vector<db::model::DepositRecord> ListParked(settle::model::ItemKind kind);

  // Moves record to status `to`. Other fields of record (destination,
  // transfer_id, note) are written with it.
  db::model::DepositRecord Transition(const db::model::DepositRecord& record, settle::model::ItemStatus to);

  // Rewrites non-status fields; the stored status must equal record.status.
  db::model::DepositRecord Save(const db::model::DepositRecord& record);

  // Terminal insert, open delete and fee entries in one transaction.
  db::model::TerminalRecord Complete(const db::model::DepositRecord& record, const Completion& completion);

  std::optional<std::int64_t> OldestOpen(settle::model::ItemKind kind);

  std::map<settle::model::ItemStatus, std::uint64_t> CountByStatus(settle::model::ItemKind kind);

 private:
  db::model::DepositRecord LoadForWrite(db::Transaction& tx, const db::model::DepositRecord& record, std::string_view op);

  std::shared_ptr<db::Repository>         repository_;
  std::shared_ptr<const util::TimeSource> clock_;
};

} // namespace settle::store
