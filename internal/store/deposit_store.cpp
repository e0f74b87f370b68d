#include "internal/store/deposit_store.hpp"

#include <algorithm>

#include "internal/db/api/throw_if_error.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace settle::store {

using settle::model::ItemKind;
using settle::model::ItemStatus;

namespace {

std::string Describe(const db::model::DepositRecord& record) {
  return std::string(settle::model::ToString(record.kind)) + " " + record.id;
}

} // namespace

DepositStore::DepositStore(std::shared_ptr<db::Repository> repository, std::shared_ptr<const util::TimeSource> clock)
    : repository_(std::move(repository)), clock_(std::move(clock)) {
}

DetectResult DepositStore::RecordDetected(const db::model::DepositRecord& record) {
  auto tx = repository_->Begin();

  if (repository_->GetTerminal(*tx, record.kind, record.id).has_value()) {
    tx->Rollback();
    return DetectResult::kAlreadyCompleted;
  }
  if (repository_->GetDeposit(*tx, record.kind, record.id).has_value()) {
    tx->Rollback();
    return DetectResult::kDuplicateOpen;
  }

  auto inserted         = record;
  inserted.status       = settle::model::InitialStatus(record.kind);
  inserted.status_since = clock_->NowSeconds();

  const auto result = repository_->InsertDeposit(*tx, inserted);
  if (result.code == db::ErrorCode::AlreadyExists) {
    tx->Rollback();
    return DetectResult::kDuplicateOpen;
  }
  db::ThrowIfDbError(result, "record detected " + Describe(record));
  tx->Commit();

  SETTLE_LOG_INFO("item detected", {observability::ItemField(inserted.id),
                                    observability::StringField("kind", settle::model::ToString(inserted.kind)),
                                    observability::UintField("amount_units", inserted.amount_units),
                                    observability::StringField("status", settle::model::ToString(inserted.status))});
  return DetectResult::kInserted;
}

std::optional<db::model::DepositRecord> DepositStore::Get(ItemKind kind, const std::string& id) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetDeposit(*tx, kind, id);
  tx->Commit();
  return record;
}

std::optional<db::model::TerminalRecord> DepositStore::GetTerminal(ItemKind kind, const std::string& id) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetTerminal(*tx, kind, id);
  tx->Commit();
  return record;
}

std::vector<db::model::DepositRecord> DepositStore::ListActionable(ItemKind kind, const std::vector<ItemStatus>& statuses, std::size_t limit,
                                                                  const std::optional<ListCursor>& after) {
  auto tx  = repository_->Begin();
  auto all = repository_->ListDeposits(*tx, kind);
  tx->Commit();

  std::vector<db::model::DepositRecord> out;
  for (auto& record : all) {
    if (after.has_value() && (record.detected_at < after->detected_at ||
                              (record.detected_at == after->detected_at && record.id <= after->id))) {
      continue;
    }
    const bool wanted = statuses.empty() ? !settle::model::IsParked(record.status)
                                         : std::find(statuses.begin(), statuses.end(), record.status) != statuses.end();
    if (!wanted) continue;
    out.push_back(std::move(record));
    if (limit != 0 && out.size() >= limit) break;
  }
  return out;
}

std::vector<db::model::DepositRecord> DepositStore::ListParked(ItemKind kind) {
  auto tx  = repository_->Begin();
  auto all = repository_->ListDeposits(*tx, kind);
  tx->Commit();

  std::vector<db::model::DepositRecord> out;
  for (auto& record : all) {
    if (settle::model::IsParked(record.status)) out.push_back(std::move(record));
  }
  return out;
}

db::model::DepositRecord DepositStore::LoadForWrite(db::Transaction& tx, const db::model::DepositRecord& record, std::string_view op) {
  auto stored = repository_->GetDeposit(tx, record.kind, record.id);
  if (!stored.has_value()) {
    throw util::NotFound(std::string(op) + ": open item not found: " + Describe(record));
  }
  if (stored->status != record.status) {
    throw util::InvalidState(std::string(op) + ": " + Describe(record) + " is " + std::string(settle::model::ToString(stored->status)) +
                             ", expected " + std::string(settle::model::ToString(record.status)));
  }
  return *stored;
}

db::model::DepositRecord DepositStore::Transition(const db::model::DepositRecord& record, ItemStatus to) {
  if (!settle::model::CanTransition(record.kind, record.status, to)) {
    throw util::InvalidState("transition " + Describe(record) + ": " + std::string(settle::model::ToString(record.status)) + " -> " +
                             std::string(settle::model::ToString(to)) + " not allowed");
  }

  auto tx = repository_->Begin();
  LoadForWrite(*tx, record, "transition");

  auto updated         = record;
  updated.status       = to;
  updated.status_since = clock_->NowSeconds();
  db::ThrowIfDbError(repository_->UpdateDeposit(*tx, updated), "transition " + Describe(record));
  tx->Commit();

  const auto level = settle::model::IsParked(to) ? spdlog::level::err : spdlog::level::info;
  observability::Log(level, "item transition",
                     {observability::ItemField(updated.id), observability::StringField("kind", settle::model::ToString(updated.kind)),
                      observability::StringField("from", settle::model::ToString(record.status)),
                      observability::StringField("to", settle::model::ToString(to)), observability::StringField("note", updated.note)});
  return updated;
}

db::model::DepositRecord DepositStore::Save(const db::model::DepositRecord& record) {
  auto tx     = repository_->Begin();
  auto stored = LoadForWrite(*tx, record, "save");

  auto updated         = record;
  updated.status_since = stored.status_since;
  db::ThrowIfDbError(repository_->UpdateDeposit(*tx, updated), "save " + Describe(record));
  tx->Commit();
  return updated;
}

db::model::TerminalRecord DepositStore::Complete(const db::model::DepositRecord& record, const Completion& completion) {
  if (!settle::model::CanComplete(record.kind, record.status, completion.outcome)) {
    throw util::InvalidState("complete " + Describe(record) + ": " + std::string(settle::model::ToString(completion.outcome)) + " not allowed from " +
                             std::string(settle::model::ToString(record.status)));
  }

  const auto now = clock_->NowSeconds();

  db::model::TerminalRecord terminal;
  terminal.id             = record.id;
  terminal.kind           = record.kind;
  terminal.outcome        = completion.outcome;
  terminal.detected_at    = record.detected_at;
  terminal.source_address = record.source_address;
  terminal.amount_units   = record.amount_units;
  terminal.payout_units   = completion.payout_units;
  terminal.fee_units      = completion.fee_units;
  terminal.destination    = record.destination;
  terminal.transfer_id    = record.transfer_id;
  terminal.reason         = completion.reason;
  terminal.completed_at   = now;

  auto tx = repository_->Begin();
  LoadForWrite(*tx, record, "complete");

  db::ThrowIfDbError(repository_->InsertTerminal(*tx, terminal), "complete " + Describe(record));
  db::ThrowIfDbError(repository_->DeleteDeposit(*tx, record.kind, record.id), "complete " + Describe(record));
  for (auto fee : completion.fees) {
    fee.created_at = now;
    db::ThrowIfDbError(repository_->InsertFeeEntry(*tx, fee), "complete " + Describe(record) + ": fee entry");
  }
  tx->Commit();

  SETTLE_LOG_INFO("item completed", {observability::ItemField(record.id),
                                     observability::StringField("kind", settle::model::ToString(record.kind)),
                                     observability::StringField("from", settle::model::ToString(record.status)),
                                     observability::StringField("outcome", settle::model::ToString(completion.outcome)),
                                     observability::UintField("payout_units", completion.payout_units),
                                     observability::UintField("fee_units", completion.fee_units)});
  return terminal;
}

std::optional<std::int64_t> DepositStore::OldestOpen(ItemKind kind) {
  auto tx     = repository_->Begin();
  auto oldest = repository_->OldestDepositTime(*tx, kind);
  tx->Commit();
  return oldest;
}

std::map<ItemStatus, std::uint64_t> DepositStore::CountByStatus(ItemKind kind) {
  auto tx  = repository_->Begin();
  auto all = repository_->ListDeposits(*tx, kind);
  tx->Commit();

  std::map<ItemStatus, std::uint64_t> counts;
  for (const auto& record : all) {
    ++counts[record.status];
  }
  return counts;
}

} // namespace settle::store
