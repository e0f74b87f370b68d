#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/db/sql/sql_queries.hpp"
#include "internal/util/errors.hpp"

namespace settle::db::sqlite {

using settle::db::ErrorCode;
using settle::db::Result;
using settle::model::ItemKind;

namespace {

// Finalizes on every exit path.
struct Statement {
    sqlite3_stmt* st = nullptr;

    Statement() = default;
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;
    ~Statement() {
        if (st) sqlite3_finalize(st);
    }
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindI64(sqlite3_stmt* st, int idx, std::int64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindU64(sqlite3_stmt* st, int idx, std::uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

std::int64_t ColI64(sqlite3_stmt* st, int col) {
    return static_cast<std::int64_t>(sqlite3_column_int64(st, col));
}

std::uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<std::uint64_t>(sqlite3_column_int64(st, col));
}

// Reads have no Result channel; a failing read must never look like
// an empty table, so it throws.
void PrepareOrThrow(sqlite3* db, const std::string& sql, Statement& stmt) {
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt.st, nullptr) != SQLITE_OK)
        throw util::StoreError(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
}

bool StepRowOrThrow(sqlite3* db, Statement& stmt) {
    int rc = sqlite3_step(stmt.st);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw util::StoreError(std::string("sqlite step: ") + sqlite3_errmsg(db));
}

settle::model::ItemStatus ColStatus(sqlite3_stmt* st, int col) {
    auto text   = ColText(st, col);
    auto status = settle::model::ParseItemStatus(text);
    if (!status) throw util::StoreError("unknown item status in store: " + text);
    return *status;
}

model::DepositRecord ReadDeposit(sqlite3_stmt* st, ItemKind kind) {
    model::DepositRecord r;
    r.id             = ColText(st, 0);
    r.kind           = kind;
    r.detected_at    = ColI64(st, 1);
    r.source_address = ColText(st, 2);
    r.owner          = ColText(st, 3);
    r.amount_units   = ColU64(st, 4);
    r.memo           = ColText(st, 5);
    r.status         = ColStatus(st, 6);
    r.destination    = ColText(st, 7);
    r.transfer_id    = ColText(st, 8);
    r.note           = ColText(st, 9);
    r.status_since   = ColI64(st, 10);
    return r;
}

model::TerminalRecord ReadTerminal(sqlite3_stmt* st, ItemKind kind) {
    model::TerminalRecord r;
    r.id   = ColText(st, 0);
    r.kind = kind;

    auto outcome = settle::model::ParseOutcome(ColText(st, 1));
    if (!outcome) throw util::StoreError("unknown outcome in store: " + ColText(st, 1));
    r.outcome = *outcome;

    r.detected_at    = ColI64(st, 2);
    r.source_address = ColText(st, 3);
    r.amount_units   = ColU64(st, 4);
    r.payout_units   = ColU64(st, 5);
    r.fee_units      = ColU64(st, 6);
    r.destination    = ColText(st, 7);
    r.transfer_id    = ColText(st, 8);
    r.reason         = ColText(st, 9);
    r.completed_at   = ColI64(st, 10);
    return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            if (sqlite3_extended_errcode(db) == SQLITE_CONSTRAINT_PRIMARYKEY ||
                sqlite3_extended_errcode(db) == SQLITE_CONSTRAINT_UNIQUE)
                return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Open items
// ------------------------------------------------------------------

Result SqliteRepository::InsertDeposit(Transaction& t, const model::DepositRecord& r) {
    auto* db = TX(t).Handle();

    Statement stmt;
    if (sqlite3_prepare_v2(db, sql::InsertDepositSql(r.kind).c_str(), -1, &stmt.st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(stmt.st, 1, r.id);
    BindI64(stmt.st, 2, r.detected_at);
    BindText(stmt.st, 3, r.source_address);
    BindText(stmt.st, 4, r.owner);
    BindU64(stmt.st, 5, r.amount_units);
    BindText(stmt.st, 6, r.memo);
    BindText(stmt.st, 7, std::string(settle::model::ToString(r.status)));
    BindText(stmt.st, 8, r.destination);
    BindText(stmt.st, 9, r.transfer_id);
    BindText(stmt.st, 10, r.note);
    BindI64(stmt.st, 11, r.status_since);

    return Translate(db, sqlite3_step(stmt.st));
}

std::optional<model::DepositRecord>
SqliteRepository::GetDeposit(Transaction& t, ItemKind kind, const std::string& id) {
    auto* db = TX(t).Handle();

    Statement stmt;
    PrepareOrThrow(db, sql::SelectDepositSql(kind), stmt);
    BindText(stmt.st, 1, id);

    if (!StepRowOrThrow(db, stmt)) return std::nullopt;
    return ReadDeposit(stmt.st, kind);
}

std::vector<model::DepositRecord> SqliteRepository::ListDeposits(Transaction& t, ItemKind kind) {
    auto* db = TX(t).Handle();

    Statement stmt;
    PrepareOrThrow(db, sql::ListDepositsSql(kind), stmt);

    std::vector<model::DepositRecord> out;
    while (StepRowOrThrow(db, stmt)) {
        out.push_back(ReadDeposit(stmt.st, kind));
    }
    return out;
}

Result SqliteRepository::UpdateDeposit(Transaction& t, const model::DepositRecord& r) {
    auto* db = TX(t).Handle();

    Statement stmt;
    if (sqlite3_prepare_v2(db, sql::UpdateDepositSql(r.kind).c_str(), -1, &stmt.st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI64(stmt.st, 1, r.detected_at);
    BindText(stmt.st, 2, r.source_address);
    BindText(stmt.st, 3, r.owner);
    BindU64(stmt.st, 4, r.amount_units);
    BindText(stmt.st, 5, r.memo);
    BindText(stmt.st, 6, std::string(settle::model::ToString(r.status)));
    BindText(stmt.st, 7, r.destination);
    BindText(stmt.st, 8, r.transfer_id);
    BindText(stmt.st, 9, r.note);
    BindI64(stmt.st, 10, r.status_since);
    BindText(stmt.st, 11, r.id);

    auto result = Translate(db, sqlite3_step(stmt.st));
    if (result && sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, r.id);
    return result;
}

Result SqliteRepository::DeleteDeposit(Transaction& t, ItemKind kind, const std::string& id) {
    auto* db = TX(t).Handle();

    Statement stmt;
    if (sqlite3_prepare_v2(db, sql::DeleteDepositSql(kind).c_str(), -1, &stmt.st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(stmt.st, 1, id);
    return Translate(db, sqlite3_step(stmt.st));
}

std::optional<std::int64_t> SqliteRepository::OldestDepositTime(Transaction& t, ItemKind kind) {
    auto* db = TX(t).Handle();

    Statement stmt;
    PrepareOrThrow(db, sql::OldestDepositSql(kind), stmt);

    if (!StepRowOrThrow(db, stmt)) return std::nullopt;
    if (sqlite3_column_type(stmt.st, 0) == SQLITE_NULL) return std::nullopt;
    return ColI64(stmt.st, 0);
}

// ------------------------------------------------------------------
// Terminal items
// ------------------------------------------------------------------

Result SqliteRepository::InsertTerminal(Transaction& t, const model::TerminalRecord& r) {
    auto* db = TX(t).Handle();

    Statement stmt;
    if (sqlite3_prepare_v2(db, sql::InsertTerminalSql(r.kind).c_str(), -1, &stmt.st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(stmt.st, 1, r.id);
    BindText(stmt.st, 2, std::string(settle::model::ToString(r.outcome)));
    BindI64(stmt.st, 3, r.detected_at);
    BindText(stmt.st, 4, r.source_address);
    BindU64(stmt.st, 5, r.amount_units);
    BindU64(stmt.st, 6, r.payout_units);
    BindU64(stmt.st, 7, r.fee_units);
    BindText(stmt.st, 8, r.destination);
    BindText(stmt.st, 9, r.transfer_id);
    BindText(stmt.st, 10, r.reason);
    BindI64(stmt.st, 11, r.completed_at);

    return Translate(db, sqlite3_step(stmt.st));
}

std::optional<model::TerminalRecord>
SqliteRepository::GetTerminal(Transaction& t, ItemKind kind, const std::string& id) {
    auto* db = TX(t).Handle();

    Statement stmt;
    PrepareOrThrow(db, sql::SelectTerminalSql(kind), stmt);
    BindText(stmt.st, 1, id);

    if (!StepRowOrThrow(db, stmt)) return std::nullopt;
    return ReadTerminal(stmt.st, kind);
}

std::vector<model::TerminalRecord> SqliteRepository::ListTerminals(Transaction& t, ItemKind kind) {
    auto* db = TX(t).Handle();

    Statement stmt;
    PrepareOrThrow(db, sql::ListTerminalsSql(kind), stmt);

    std::vector<model::TerminalRecord> out;
    while (StepRowOrThrow(db, stmt)) {
        out.push_back(ReadTerminal(stmt.st, kind));
    }
    return out;
}

// ------------------------------------------------------------------
// Reservations
// ------------------------------------------------------------------

Result SqliteRepository::InsertReservation(Transaction& t, const model::ReservationRecord& r) {
    auto* db = TX(t).Handle();

    Statement stmt;
    if (sqlite3_prepare_v2(db, sql::INSERT_RESERVATION, -1, &stmt.st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(stmt.st, 1, r.kind);
    BindText(stmt.st, 2, r.key);
    BindText(stmt.st, 3, r.holder);
    BindI64(stmt.st, 4, r.expires_at);

    return Translate(db, sqlite3_step(stmt.st));
}

std::optional<model::ReservationRecord>
SqliteRepository::GetReservation(Transaction& t, const std::string& kind, const std::string& key) {
    auto* db = TX(t).Handle();

    Statement stmt;
    PrepareOrThrow(db, sql::SELECT_RESERVATION, stmt);
    BindText(stmt.st, 1, kind);
    BindText(stmt.st, 2, key);

    if (!StepRowOrThrow(db, stmt)) return std::nullopt;

    model::ReservationRecord r;
    r.kind       = ColText(stmt.st, 0);
    r.key        = ColText(stmt.st, 1);
    r.holder     = ColText(stmt.st, 2);
    r.expires_at = ColI64(stmt.st, 3);
    return r;
}

Result SqliteRepository::DeleteReservation(Transaction& t, const std::string& kind, const std::string& key) {
    auto* db = TX(t).Handle();

    Statement stmt;
    if (sqlite3_prepare_v2(db, sql::DELETE_RESERVATION, -1, &stmt.st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(stmt.st, 1, kind);
    BindText(stmt.st, 2, key);
    return Translate(db, sqlite3_step(stmt.st));
}

Result SqliteRepository::DeleteExpiredReservations(Transaction& t, std::int64_t now, std::uint64_t* removed) {
    auto* db = TX(t).Handle();

    Statement stmt;
    if (sqlite3_prepare_v2(db, sql::DELETE_EXPIRED_RESERVATIONS, -1, &stmt.st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI64(stmt.st, 1, now);
    auto result = Translate(db, sqlite3_step(stmt.st));
    if (result && removed) *removed = static_cast<std::uint64_t>(sqlite3_changes(db));
    return result;
}

// ------------------------------------------------------------------
// Attempts
// ------------------------------------------------------------------

std::optional<model::AttemptRecord>
SqliteRepository::GetAttempt(Transaction& t, const std::string& action_key) {
    auto* db = TX(t).Handle();

    Statement stmt;
    PrepareOrThrow(db, sql::SELECT_ATTEMPT, stmt);
    BindText(stmt.st, 1, action_key);

    if (!StepRowOrThrow(db, stmt)) return std::nullopt;

    model::AttemptRecord r;
    r.action_key      = ColText(stmt.st, 0);
    r.count           = static_cast<std::uint32_t>(sqlite3_column_int64(stmt.st, 1));
    r.last_attempt_at = ColI64(stmt.st, 2);
    return r;
}

Result SqliteRepository::UpsertAttempt(Transaction& t, const model::AttemptRecord& r) {
    auto* db = TX(t).Handle();

    Statement stmt;
    if (sqlite3_prepare_v2(db, sql::UPSERT_ATTEMPT, -1, &stmt.st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(stmt.st, 1, r.action_key);
    BindI64(stmt.st, 2, r.count);
    BindI64(stmt.st, 3, r.last_attempt_at);
    return Translate(db, sqlite3_step(stmt.st));
}

Result SqliteRepository::DeleteAttempt(Transaction& t, const std::string& action_key) {
    auto* db = TX(t).Handle();

    Statement stmt;
    if (sqlite3_prepare_v2(db, sql::DELETE_ATTEMPT, -1, &stmt.st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(stmt.st, 1, action_key);
    return Translate(db, sqlite3_step(stmt.st));
}

// ------------------------------------------------------------------
// Watermarks
// ------------------------------------------------------------------

Result SqliteRepository::UpsertWatermarkProposal(Transaction& t, const model::WatermarkProposal& r) {
    auto* db = TX(t).Handle();

    Statement stmt;
    if (sqlite3_prepare_v2(db, sql::UPSERT_WATERMARK_PROPOSAL, -1, &stmt.st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(stmt.st, 1, r.chain);
    BindI64(stmt.st, 2, r.value);
    BindI64(stmt.st, 3, r.created_at);
    return Translate(db, sqlite3_step(stmt.st));
}

std::vector<model::WatermarkProposal> SqliteRepository::ListWatermarkProposals(Transaction& t) {
    auto* db = TX(t).Handle();

    Statement stmt;
    PrepareOrThrow(db, sql::LIST_WATERMARK_PROPOSALS, stmt);

    std::vector<model::WatermarkProposal> out;
    while (StepRowOrThrow(db, stmt)) {
        model::WatermarkProposal p;
        p.chain      = ColText(stmt.st, 0);
        p.value      = ColI64(stmt.st, 1);
        p.created_at = ColI64(stmt.st, 2);
        out.push_back(std::move(p));
    }
    return out;
}

Result SqliteRepository::DeleteWatermarkProposal(Transaction& t, const std::string& chain) {
    auto* db = TX(t).Handle();

    Statement stmt;
    if (sqlite3_prepare_v2(db, sql::DELETE_WATERMARK_PROPOSAL, -1, &stmt.st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(stmt.st, 1, chain);
    return Translate(db, sqlite3_step(stmt.st));
}

std::optional<model::WatermarkRecord>
SqliteRepository::GetWatermark(Transaction& t, const std::string& chain) {
    auto* db = TX(t).Handle();

    Statement stmt;
    PrepareOrThrow(db, sql::SELECT_WATERMARK, stmt);
    BindText(stmt.st, 1, chain);

    if (!StepRowOrThrow(db, stmt)) return std::nullopt;

    model::WatermarkRecord r;
    r.chain        = ColText(stmt.st, 0);
    r.value        = ColI64(stmt.st, 1);
    r.committed_at = ColI64(stmt.st, 2);
    return r;
}

Result SqliteRepository::UpsertWatermark(Transaction& t, const model::WatermarkRecord& r) {
    auto* db = TX(t).Handle();

    Statement stmt;
    if (sqlite3_prepare_v2(db, sql::UPSERT_WATERMARK, -1, &stmt.st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(stmt.st, 1, r.chain);
    BindI64(stmt.st, 2, r.value);
    BindI64(stmt.st, 3, r.committed_at);
    return Translate(db, sqlite3_step(stmt.st));
}

// ------------------------------------------------------------------
// Fees
// ------------------------------------------------------------------

Result SqliteRepository::InsertFeeEntry(Transaction& t, const model::FeeEntry& r) {
    auto* db = TX(t).Handle();

    Statement stmt;
    if (sqlite3_prepare_v2(db, sql::INSERT_FEE_ENTRY, -1, &stmt.st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(stmt.st, 1, r.source_ref);
    BindText(stmt.st, 2, std::string(settle::model::ToString(r.kind)));
    BindU64(stmt.st, 3, r.amount_token_units);
    BindU64(stmt.st, 4, r.amount_register_units);
    BindI64(stmt.st, 5, r.created_at);
    return Translate(db, sqlite3_step(stmt.st));
}

std::vector<model::FeeEntry> SqliteRepository::ListFeeEntries(Transaction& t) {
    auto* db = TX(t).Handle();

    Statement stmt;
    PrepareOrThrow(db, sql::LIST_FEE_ENTRIES, stmt);

    std::vector<model::FeeEntry> out;
    while (StepRowOrThrow(db, stmt)) {
        model::FeeEntry e;
        e.id         = ColI64(stmt.st, 0);
        e.source_ref = ColText(stmt.st, 1);

        auto kind = settle::model::ParseFeeKind(ColText(stmt.st, 2));
        if (!kind) throw util::StoreError("unknown fee kind in store: " + ColText(stmt.st, 2));
        e.kind = *kind;

        e.amount_token_units    = ColU64(stmt.st, 3);
        e.amount_register_units = ColU64(stmt.st, 4);
        e.created_at            = ColI64(stmt.st, 5);
        out.push_back(std::move(e));
    }
    return out;
}

Result SqliteRepository::UpsertFeeSummary(Transaction& t, const model::FeeSummary& r) {
    auto* db = TX(t).Handle();

    Statement stmt;
    if (sqlite3_prepare_v2(db, sql::UPSERT_FEE_SUMMARY, -1, &stmt.st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindU64(stmt.st, 1, r.token_units_total);
    BindU64(stmt.st, 2, r.register_units_total);
    BindU64(stmt.st, 3, r.entry_count);
    BindI64(stmt.st, 4, r.refreshed_at);
    return Translate(db, sqlite3_step(stmt.st));
}

std::optional<model::FeeSummary> SqliteRepository::GetFeeSummary(Transaction& t) {
    auto* db = TX(t).Handle();

    Statement stmt;
    PrepareOrThrow(db, sql::SELECT_FEE_SUMMARY, stmt);

    if (!StepRowOrThrow(db, stmt)) return std::nullopt;

    model::FeeSummary s;
    s.token_units_total    = ColU64(stmt.st, 0);
    s.register_units_total = ColU64(stmt.st, 1);
    s.entry_count          = ColU64(stmt.st, 2);
    s.refreshed_at         = ColI64(stmt.st, 3);
    return s;
}

} // namespace settle::db::sqlite
