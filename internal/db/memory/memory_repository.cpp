#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace settle::db::memory {

using settle::model::ItemKind;

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

template <typename State>
static auto& OpenTable(State& s, ItemKind kind) {
  return kind == ItemKind::kTokenDeposit ? s.token_deposits : s.register_credits;
}

template <typename State>
static auto& DoneTable(State& s, ItemKind kind) {
  return kind == ItemKind::kTokenDeposit ? s.token_deposits_done : s.register_credits_done;
}

// ------------------------------------------------------------------
// Open items
// ------------------------------------------------------------------

Result MemoryRepository::InsertDeposit(Transaction& t, const model::DepositRecord& r) {
  auto& table = OpenTable(TX(t).Mutable(), r.kind);
  if (table.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, r.id);
  table[r.id] = r;
  return Result::Ok();
}

std::optional<model::DepositRecord> MemoryRepository::GetDeposit(Transaction& t, ItemKind kind, const std::string& id) {
  const auto& table = OpenTable(TX(t).View(), kind);
  auto        it    = table.find(id);
  if (it == table.end()) return std::nullopt;
  return it->second;
}

std::vector<model::DepositRecord> MemoryRepository::ListDeposits(Transaction& t, ItemKind kind) {
  const auto&                       table = OpenTable(TX(t).View(), kind);
  std::vector<model::DepositRecord> records;
  records.reserve(table.size());
  for (const auto& [_, record] : table) {
    records.push_back(record);
  }
  std::stable_sort(records.begin(), records.end(), [](const auto& a, const auto& b) {
    if (a.detected_at != b.detected_at) return a.detected_at < b.detected_at;
    return a.id < b.id;
  });
  return records;
}

Result MemoryRepository::UpdateDeposit(Transaction& t, const model::DepositRecord& r) {
  auto& table = OpenTable(TX(t).Mutable(), r.kind);
  auto  it    = table.find(r.id);
  if (it == table.end()) return Result::Err(ErrorCode::NotFound, r.id);
  it->second = r;
  return Result::Ok();
}

Result MemoryRepository::DeleteDeposit(Transaction& t, ItemKind kind, const std::string& id) {
  OpenTable(TX(t).Mutable(), kind).erase(id);
  return Result::Ok();
}

std::optional<std::int64_t> MemoryRepository::OldestDepositTime(Transaction& t, ItemKind kind) {
  std::optional<std::int64_t> oldest;
  for (const auto& [_, record] : OpenTable(TX(t).View(), kind)) {
    if (!oldest || record.detected_at < *oldest) oldest = record.detected_at;
  }
  return oldest;
}

// ------------------------------------------------------------------
// Terminal items
// ------------------------------------------------------------------

Result MemoryRepository::InsertTerminal(Transaction& t, const model::TerminalRecord& r) {
  auto& table = DoneTable(TX(t).Mutable(), r.kind);
  if (table.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, r.id);
  table[r.id] = r;
  return Result::Ok();
}

std::optional<model::TerminalRecord> MemoryRepository::GetTerminal(Transaction& t, ItemKind kind, const std::string& id) {
  const auto& table = DoneTable(TX(t).View(), kind);
  auto        it    = table.find(id);
  if (it == table.end()) return std::nullopt;
  return it->second;
}

std::vector<model::TerminalRecord> MemoryRepository::ListTerminals(Transaction& t, ItemKind kind) {
  std::vector<model::TerminalRecord> out;
  for (const auto& [_, record] : DoneTable(TX(t).View(), kind)) {
    out.push_back(record);
  }
  return out;
}

// ------------------------------------------------------------------
// Reservations
// ------------------------------------------------------------------

Result MemoryRepository::InsertReservation(Transaction& t, const model::ReservationRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.reservations.contains({r.kind, r.key})) return Result::Err(ErrorCode::AlreadyExists, r.kind + "/" + r.key);
  s.reservations[{r.kind, r.key}] = r;
  return Result::Ok();
}

std::optional<model::ReservationRecord> MemoryRepository::GetReservation(Transaction& t, const std::string& kind, const std::string& key) {
  const auto& s  = TX(t).View();
  auto        it = s.reservations.find({kind, key});
  if (it == s.reservations.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::DeleteReservation(Transaction& t, const std::string& kind, const std::string& key) {
  TX(t).Mutable().reservations.erase({kind, key});
  return Result::Ok();
}

Result MemoryRepository::DeleteExpiredReservations(Transaction& t, std::int64_t now, std::uint64_t* removed) {
  auto&         s     = TX(t).Mutable();
  std::uint64_t count = 0;
  for (auto it = s.reservations.begin(); it != s.reservations.end();) {
    if (it->second.expires_at <= now) {
      it = s.reservations.erase(it);
      ++count;
      continue;
    }
    ++it;
  }
  if (removed) *removed = count;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Attempts
// ------------------------------------------------------------------

std::optional<model::AttemptRecord> MemoryRepository::GetAttempt(Transaction& t, const std::string& action_key) {
  const auto& s  = TX(t).View();
  auto        it = s.attempts.find(action_key);
  if (it == s.attempts.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpsertAttempt(Transaction& t, const model::AttemptRecord& r) {
  TX(t).Mutable().attempts[r.action_key] = r;
  return Result::Ok();
}

Result MemoryRepository::DeleteAttempt(Transaction& t, const std::string& action_key) {
  TX(t).Mutable().attempts.erase(action_key);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Watermarks
// ------------------------------------------------------------------

Result MemoryRepository::UpsertWatermarkProposal(Transaction& t, const model::WatermarkProposal& r) {
  TX(t).Mutable().watermark_proposals[r.chain] = r;
  return Result::Ok();
}

std::vector<model::WatermarkProposal> MemoryRepository::ListWatermarkProposals(Transaction& t) {
  std::vector<model::WatermarkProposal> out;
  for (const auto& [_, proposal] : TX(t).View().watermark_proposals) {
    out.push_back(proposal);
  }
  return out;
}

Result MemoryRepository::DeleteWatermarkProposal(Transaction& t, const std::string& chain) {
  TX(t).Mutable().watermark_proposals.erase(chain);
  return Result::Ok();
}

std::optional<model::WatermarkRecord> MemoryRepository::GetWatermark(Transaction& t, const std::string& chain) {
  const auto& s  = TX(t).View();
  auto        it = s.watermarks.find(chain);
  if (it == s.watermarks.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpsertWatermark(Transaction& t, const model::WatermarkRecord& r) {
  TX(t).Mutable().watermarks[r.chain] = r;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Fees
// ------------------------------------------------------------------

Result MemoryRepository::InsertFeeEntry(Transaction& t, const model::FeeEntry& r) {
  auto& s     = TX(t).Mutable();
  auto  entry = r;
  entry.id    = s.next_fee_id++;
  s.fee_entries.push_back(std::move(entry));
  return Result::Ok();
}

std::vector<model::FeeEntry> MemoryRepository::ListFeeEntries(Transaction& t) {
  return TX(t).View().fee_entries;
}

Result MemoryRepository::UpsertFeeSummary(Transaction& t, const model::FeeSummary& r) {
  TX(t).Mutable().fee_summary = r;
  return Result::Ok();
}

std::optional<model::FeeSummary> MemoryRepository::GetFeeSummary(Transaction& t) {
  return TX(t).View().fee_summary;
}

} // namespace settle::db::memory
