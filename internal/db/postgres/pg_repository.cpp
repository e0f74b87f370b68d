#include "pg_repository.hpp"

#include "internal/db/sql/sql_queries.hpp"
#include "internal/util/errors.hpp"

namespace settle::db::postgres {

using settle::model::ItemKind;

namespace {

// std::string so statement names can be built with operator+.
std::string OpenTable(ItemKind kind) {
  return sql::OpenTable(kind);
}

std::string DoneTable(ItemKind kind) {
  return sql::DoneTable(kind);
}

std::int64_t AsI64(std::uint64_t v) {
  return static_cast<std::int64_t>(v);
}

model::DepositRecord ReadDeposit(const pqxx::row& row, ItemKind kind) {
  model::DepositRecord r;
  r.id             = row[0].c_str();
  r.kind           = kind;
  r.detected_at    = row[1].as<std::int64_t>();
  r.source_address = row[2].c_str();
  r.owner          = row[3].c_str();
  r.amount_units   = static_cast<std::uint64_t>(row[4].as<std::int64_t>());
  r.memo           = row[5].c_str();

  auto status = settle::model::ParseItemStatus(row[6].c_str());
  if (!status) throw util::StoreError(std::string("unknown item status in store: ") + row[6].c_str());
  r.status = *status;

  r.destination  = row[7].c_str();
  r.transfer_id  = row[8].c_str();
  r.note         = row[9].c_str();
  r.status_since = row[10].as<std::int64_t>();
  return r;
}

model::TerminalRecord ReadTerminal(const pqxx::row& row, ItemKind kind) {
  model::TerminalRecord r;
  r.id   = row[0].c_str();
  r.kind = kind;

  auto outcome = settle::model::ParseOutcome(row[1].c_str());
  if (!outcome) throw util::StoreError(std::string("unknown outcome in store: ") + row[1].c_str());
  r.outcome = *outcome;

  r.detected_at    = row[2].as<std::int64_t>();
  r.source_address = row[3].c_str();
  r.amount_units   = static_cast<std::uint64_t>(row[4].as<std::int64_t>());
  r.payout_units   = static_cast<std::uint64_t>(row[5].as<std::int64_t>());
  r.fee_units      = static_cast<std::uint64_t>(row[6].as<std::int64_t>());
  r.destination    = row[7].c_str();
  r.transfer_id    = row[8].c_str();
  r.reason         = row[9].c_str();
  r.completed_at   = row[10].as<std::int64_t>();
  return r;
}

// Reads surface driver failures as StoreError.
template <typename Fn>
auto Read(Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const util::StoreError&) {
    throw;
  } catch (const std::exception& e) {
    throw util::StoreError(e.what());
  }
}

} // namespace

// Installed on every pooled connection before its first transaction.
void PgRepository::PrepareStatements(pqxx::connection& conn) {
  for (const ItemKind kind : {ItemKind::kTokenDeposit, ItemKind::kRegisterCredit}) {
    const std::string open = OpenTable(kind);
    const std::string done = DoneTable(kind);

    conn.prepare("insert_" + open,
                 "INSERT INTO " + open +
                     "(id,detected_at,source_address,owner,amount_units,memo,status,destination,transfer_id,note,status_since) "
                     "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11)");

    conn.prepare("get_" + open,
                 "SELECT id,detected_at,source_address,owner,amount_units,memo,status,destination,transfer_id,note,status_since "
                 "FROM " + open + " WHERE id=$1");

    conn.prepare("list_" + open,
                 "SELECT id,detected_at,source_address,owner,amount_units,memo,status,destination,transfer_id,note,status_since "
                 "FROM " + open + " ORDER BY detected_at, id");

    conn.prepare("update_" + open,
                 "UPDATE " + open +
                     " SET detected_at=$2,source_address=$3,owner=$4,amount_units=$5,memo=$6,status=$7,destination=$8,"
                     "transfer_id=$9,note=$10,status_since=$11 WHERE id=$1");

    conn.prepare("delete_" + open, "DELETE FROM " + open + " WHERE id=$1");

    conn.prepare("oldest_" + open, "SELECT MIN(detected_at) FROM " + open);

    conn.prepare("insert_" + done,
                 "INSERT INTO " + done +
                     "(id,outcome,detected_at,source_address,amount_units,payout_units,fee_units,destination,transfer_id,reason,completed_at) "
                     "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11)");

    conn.prepare("get_" + done,
                 "SELECT id,outcome,detected_at,source_address,amount_units,payout_units,fee_units,destination,transfer_id,reason,completed_at "
                 "FROM " + done + " WHERE id=$1");

    conn.prepare("list_" + done,
                 "SELECT id,outcome,detected_at,source_address,amount_units,payout_units,fee_units,destination,transfer_id,reason,completed_at "
                 "FROM " + done + " ORDER BY completed_at, id");
  }

  conn.prepare("insert_reservation", "INSERT INTO reservations(kind,key,holder,expires_at) VALUES($1,$2,$3,$4)");
  conn.prepare("get_reservation", "SELECT kind,key,holder,expires_at FROM reservations WHERE kind=$1 AND key=$2");
  conn.prepare("delete_reservation", "DELETE FROM reservations WHERE kind=$1 AND key=$2");
  conn.prepare("delete_expired_reservations", "DELETE FROM reservations WHERE expires_at<=$1");

  conn.prepare("get_attempt", "SELECT action_key,count,last_attempt_at FROM attempts WHERE action_key=$1");
  conn.prepare("upsert_attempt",
               "INSERT INTO attempts(action_key,count,last_attempt_at) VALUES($1,$2,$3) "
               "ON CONFLICT(action_key) DO UPDATE SET count=excluded.count, last_attempt_at=excluded.last_attempt_at");
  conn.prepare("delete_attempt", "DELETE FROM attempts WHERE action_key=$1");

  conn.prepare("upsert_watermark_proposal",
               "INSERT INTO watermark_proposals(chain,value,created_at) VALUES($1,$2,$3) "
               "ON CONFLICT(chain) DO UPDATE SET value=excluded.value, created_at=excluded.created_at");
  conn.prepare("list_watermark_proposals", "SELECT chain,value,created_at FROM watermark_proposals ORDER BY chain");
  conn.prepare("delete_watermark_proposal", "DELETE FROM watermark_proposals WHERE chain=$1");
  conn.prepare("get_watermark", "SELECT chain,value,committed_at FROM watermarks WHERE chain=$1");
  conn.prepare("upsert_watermark",
               "INSERT INTO watermarks(chain,value,committed_at) VALUES($1,$2,$3) "
               "ON CONFLICT(chain) DO UPDATE SET value=excluded.value, committed_at=excluded.committed_at");

  conn.prepare("insert_fee_entry",
               "INSERT INTO fee_entries(source_ref,kind,amount_token_units,amount_register_units,created_at) VALUES($1,$2,$3,$4,$5)");
  conn.prepare("list_fee_entries",
               "SELECT id,source_ref,kind,amount_token_units,amount_register_units,created_at FROM fee_entries ORDER BY id");
  conn.prepare("upsert_fee_summary",
               "INSERT INTO fee_summary(id,token_units_total,register_units_total,entry_count,refreshed_at) VALUES(1,$1,$2,$3,$4) "
               "ON CONFLICT(id) DO UPDATE SET token_units_total=excluded.token_units_total, "
               "register_units_total=excluded.register_units_total, entry_count=excluded.entry_count, "
               "refreshed_at=excluded.refreshed_at");
  conn.prepare("get_fee_summary", "SELECT token_units_total,register_units_total,entry_count,refreshed_at FROM fee_summary WHERE id=1");
}

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(*pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Open items
// ------------------------------------------------------------------

Result PgRepository::InsertDeposit(Transaction& t, const model::DepositRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_" + OpenTable(r.kind), r.id, r.detected_at, r.source_address, r.owner, AsI64(r.amount_units), r.memo,
                               std::string(settle::model::ToString(r.status)), r.destination, r.transfer_id, r.note, r.status_since);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::DepositRecord> PgRepository::GetDeposit(Transaction& t, ItemKind kind, const std::string& id) {
  return Read([&]() -> std::optional<model::DepositRecord> {
    auto res = TX(t).Work().exec_prepared("get_" + OpenTable(kind), id);
    if (res.empty()) return std::nullopt;
    return ReadDeposit(res[0], kind);
  });
}

std::vector<model::DepositRecord> PgRepository::ListDeposits(Transaction& t, ItemKind kind) {
  return Read([&]() {
    auto                              res = TX(t).Work().exec_prepared("list_" + OpenTable(kind));
    std::vector<model::DepositRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) {
      out.push_back(ReadDeposit(row, kind));
    }
    return out;
  });
}

Result PgRepository::UpdateDeposit(Transaction& t, const model::DepositRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("update_" + OpenTable(r.kind), r.id, r.detected_at, r.source_address, r.owner, AsI64(r.amount_units),
                                          r.memo, std::string(settle::model::ToString(r.status)), r.destination, r.transfer_id, r.note,
                                          r.status_since);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, r.id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteDeposit(Transaction& t, ItemKind kind, const std::string& id) {
  try {
    TX(t).Work().exec_prepared("delete_" + OpenTable(kind), id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<std::int64_t> PgRepository::OldestDepositTime(Transaction& t, ItemKind kind) {
  return Read([&]() -> std::optional<std::int64_t> {
    auto res = TX(t).Work().exec_prepared("oldest_" + OpenTable(kind));
    if (res.empty() || res[0][0].is_null()) return std::nullopt;
    return res[0][0].as<std::int64_t>();
  });
}

// ------------------------------------------------------------------
// Terminal items
// ------------------------------------------------------------------

Result PgRepository::InsertTerminal(Transaction& t, const model::TerminalRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_" + DoneTable(r.kind), r.id, std::string(settle::model::ToString(r.outcome)), r.detected_at,
                               r.source_address, AsI64(r.amount_units), AsI64(r.payout_units), AsI64(r.fee_units), r.destination,
                               r.transfer_id, r.reason, r.completed_at);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::TerminalRecord> PgRepository::GetTerminal(Transaction& t, ItemKind kind, const std::string& id) {
  return Read([&]() -> std::optional<model::TerminalRecord> {
    auto res = TX(t).Work().exec_prepared("get_" + DoneTable(kind), id);
    if (res.empty()) return std::nullopt;
    return ReadTerminal(res[0], kind);
  });
}

std::vector<model::TerminalRecord> PgRepository::ListTerminals(Transaction& t, ItemKind kind) {
  return Read([&]() {
    auto                               res = TX(t).Work().exec_prepared("list_" + DoneTable(kind));
    std::vector<model::TerminalRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) {
      out.push_back(ReadTerminal(row, kind));
    }
    return out;
  });
}

// ------------------------------------------------------------------
// Reservations
// ------------------------------------------------------------------

Result PgRepository::InsertReservation(Transaction& t, const model::ReservationRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_reservation", r.kind, r.key, r.holder, r.expires_at);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ReservationRecord> PgRepository::GetReservation(Transaction& t, const std::string& kind, const std::string& key) {
  return Read([&]() -> std::optional<model::ReservationRecord> {
    auto res = TX(t).Work().exec_prepared("get_reservation", kind, key);
    if (res.empty()) return std::nullopt;

    model::ReservationRecord r;
    r.kind       = res[0][0].c_str();
    r.key        = res[0][1].c_str();
    r.holder     = res[0][2].c_str();
    r.expires_at = res[0][3].as<std::int64_t>();
    return r;
  });
}

Result PgRepository::DeleteReservation(Transaction& t, const std::string& kind, const std::string& key) {
  try {
    TX(t).Work().exec_prepared("delete_reservation", kind, key);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteExpiredReservations(Transaction& t, std::int64_t now, std::uint64_t* removed) {
  try {
    auto res = TX(t).Work().exec_prepared("delete_expired_reservations", now);
    if (removed) *removed = static_cast<std::uint64_t>(res.affected_rows());
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Attempts
// ------------------------------------------------------------------

std::optional<model::AttemptRecord> PgRepository::GetAttempt(Transaction& t, const std::string& action_key) {
  return Read([&]() -> std::optional<model::AttemptRecord> {
    auto res = TX(t).Work().exec_prepared("get_attempt", action_key);
    if (res.empty()) return std::nullopt;

    model::AttemptRecord r;
    r.action_key      = res[0][0].c_str();
    r.count           = res[0][1].as<std::uint32_t>();
    r.last_attempt_at = res[0][2].as<std::int64_t>();
    return r;
  });
}

Result PgRepository::UpsertAttempt(Transaction& t, const model::AttemptRecord& r) {
  try {
    TX(t).Work().exec_prepared("upsert_attempt", r.action_key, static_cast<std::int64_t>(r.count), r.last_attempt_at);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteAttempt(Transaction& t, const std::string& action_key) {
  try {
    TX(t).Work().exec_prepared("delete_attempt", action_key);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Watermarks
// ------------------------------------------------------------------

Result PgRepository::UpsertWatermarkProposal(Transaction& t, const model::WatermarkProposal& r) {
  try {
    TX(t).Work().exec_prepared("upsert_watermark_proposal", r.chain, r.value, r.created_at);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::WatermarkProposal> PgRepository::ListWatermarkProposals(Transaction& t) {
  return Read([&]() {
    auto                                  res = TX(t).Work().exec_prepared("list_watermark_proposals");
    std::vector<model::WatermarkProposal> out;
    for (const auto& row : res) {
      model::WatermarkProposal p;
      p.chain      = row[0].c_str();
      p.value      = row[1].as<std::int64_t>();
      p.created_at = row[2].as<std::int64_t>();
      out.push_back(std::move(p));
    }
    return out;
  });
}

Result PgRepository::DeleteWatermarkProposal(Transaction& t, const std::string& chain) {
  try {
    TX(t).Work().exec_prepared("delete_watermark_proposal", chain);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::WatermarkRecord> PgRepository::GetWatermark(Transaction& t, const std::string& chain) {
  return Read([&]() -> std::optional<model::WatermarkRecord> {
    auto res = TX(t).Work().exec_prepared("get_watermark", chain);
    if (res.empty()) return std::nullopt;

    model::WatermarkRecord r;
    r.chain        = res[0][0].c_str();
    r.value        = res[0][1].as<std::int64_t>();
    r.committed_at = res[0][2].as<std::int64_t>();
    return r;
  });
}

Result PgRepository::UpsertWatermark(Transaction& t, const model::WatermarkRecord& r) {
  try {
    TX(t).Work().exec_prepared("upsert_watermark", r.chain, r.value, r.committed_at);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Fees
// ------------------------------------------------------------------

Result PgRepository::InsertFeeEntry(Transaction& t, const model::FeeEntry& r) {
  try {
    TX(t).Work().exec_prepared("insert_fee_entry", r.source_ref, std::string(settle::model::ToString(r.kind)), AsI64(r.amount_token_units),
                               AsI64(r.amount_register_units), r.created_at);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::FeeEntry> PgRepository::ListFeeEntries(Transaction& t) {
  return Read([&]() {
    auto                         res = TX(t).Work().exec_prepared("list_fee_entries");
    std::vector<model::FeeEntry> out;
    for (const auto& row : res) {
      model::FeeEntry e;
      e.id         = row[0].as<std::int64_t>();
      e.source_ref = row[1].c_str();

      auto kind = settle::model::ParseFeeKind(row[2].c_str());
      if (!kind) throw util::StoreError(std::string("unknown fee kind in store: ") + row[2].c_str());
      e.kind = *kind;

      e.amount_token_units    = static_cast<std::uint64_t>(row[3].as<std::int64_t>());
      e.amount_register_units = static_cast<std::uint64_t>(row[4].as<std::int64_t>());
      e.created_at            = row[5].as<std::int64_t>();
      out.push_back(std::move(e));
    }
    return out;
  });
}

Result PgRepository::UpsertFeeSummary(Transaction& t, const model::FeeSummary& r) {
  try {
    TX(t).Work().exec_prepared("upsert_fee_summary", AsI64(r.token_units_total), AsI64(r.register_units_total), AsI64(r.entry_count),
                               r.refreshed_at);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::FeeSummary> PgRepository::GetFeeSummary(Transaction& t) {
  return Read([&]() -> std::optional<model::FeeSummary> {
    auto res = TX(t).Work().exec_prepared("get_fee_summary");
    if (res.empty()) return std::nullopt;

    model::FeeSummary s;
    s.token_units_total    = static_cast<std::uint64_t>(res[0][0].as<std::int64_t>());
    s.register_units_total = static_cast<std::uint64_t>(res[0][1].as<std::int64_t>());
    s.entry_count          = static_cast<std::uint64_t>(res[0][2].as<std::int64_t>());
    s.refreshed_at         = res[0][3].as<std::int64_t>();
    return s;
  });
}

} // namespace settle::db::postgres
