#pragma once

#include <string>

#include "internal/model/item.hpp"

namespace settle::db::sql {

/*
  Canonical SQL for the SQLite backend.

  Open and terminal tables share one column layout per direction, so
  the statements are built from the direction's table name.
*/

inline const char* OpenTable(settle::model::ItemKind kind) {
  return kind == settle::model::ItemKind::kTokenDeposit ? "token_deposits" : "register_credits";
}

inline const char* DoneTable(settle::model::ItemKind kind) {
  return kind == settle::model::ItemKind::kTokenDeposit ? "token_deposits_done" : "register_credits_done";
}

static constexpr const char* DEPOSIT_COLUMNS =
    "id,detected_at,source_address,owner,amount_units,memo,status,destination,transfer_id,note,status_since";

static constexpr const char* TERMINAL_COLUMNS =
    "id,outcome,detected_at,source_address,amount_units,payout_units,fee_units,destination,transfer_id,reason,completed_at";

inline std::string InsertDepositSql(settle::model::ItemKind kind) {
  return std::string("INSERT INTO ") + OpenTable(kind) + "(" + DEPOSIT_COLUMNS + ") VALUES(?,?,?,?,?,?,?,?,?,?,?);";
}

inline std::string SelectDepositSql(settle::model::ItemKind kind) {
  return std::string("SELECT ") + DEPOSIT_COLUMNS + " FROM " + OpenTable(kind) + " WHERE id=?;";
}

inline std::string ListDepositsSql(settle::model::ItemKind kind) {
  return std::string("SELECT ") + DEPOSIT_COLUMNS + " FROM " + OpenTable(kind) + " ORDER BY detected_at, id;";
}

inline std::string UpdateDepositSql(settle::model::ItemKind kind) {
  return std::string("UPDATE ") + OpenTable(kind) +
         " SET detected_at=?,source_address=?,owner=?,amount_units=?,memo=?,status=?,destination=?,transfer_id=?,note=?,status_since=?"
         " WHERE id=?;";
}

inline std::string DeleteDepositSql(settle::model::ItemKind kind) {
  return std::string("DELETE FROM ") + OpenTable(kind) + " WHERE id=?;";
}

inline std::string OldestDepositSql(settle::model::ItemKind kind) {
  return std::string("SELECT MIN(detected_at) FROM ") + OpenTable(kind) + ";";
}

inline std::string InsertTerminalSql(settle::model::ItemKind kind) {
  return std::string("INSERT INTO ") + DoneTable(kind) + "(" + TERMINAL_COLUMNS + ") VALUES(?,?,?,?,?,?,?,?,?,?,?);";
}

inline std::string SelectTerminalSql(settle::model::ItemKind kind) {
  return std::string("SELECT ") + TERMINAL_COLUMNS + " FROM " + DoneTable(kind) + " WHERE id=?;";
}

inline std::string ListTerminalsSql(settle::model::ItemKind kind) {
  return std::string("SELECT ") + TERMINAL_COLUMNS + " FROM " + DoneTable(kind) + " ORDER BY completed_at, id;";
}

// reservations

static constexpr const char* INSERT_RESERVATION =
    "INSERT INTO reservations(kind,key,holder,expires_at) VALUES(?,?,?,?);";

static constexpr const char* SELECT_RESERVATION =
    "SELECT kind,key,holder,expires_at FROM reservations WHERE kind=? AND key=?;";

static constexpr const char* DELETE_RESERVATION =
    "DELETE FROM reservations WHERE kind=? AND key=?;";

static constexpr const char* DELETE_EXPIRED_RESERVATIONS =
    "DELETE FROM reservations WHERE expires_at<=?;";

// attempts

static constexpr const char* SELECT_ATTEMPT =
    "SELECT action_key,count,last_attempt_at FROM attempts WHERE action_key=?;";

static constexpr const char* UPSERT_ATTEMPT =
    "INSERT INTO attempts(action_key,count,last_attempt_at) VALUES(?,?,?)"
    " ON CONFLICT(action_key) DO UPDATE SET count=excluded.count, last_attempt_at=excluded.last_attempt_at;";

static constexpr const char* DELETE_ATTEMPT =
    "DELETE FROM attempts WHERE action_key=?;";

// watermarks

static constexpr const char* UPSERT_WATERMARK_PROPOSAL =
    "INSERT INTO watermark_proposals(chain,value,created_at) VALUES(?,?,?)"
    " ON CONFLICT(chain) DO UPDATE SET value=excluded.value, created_at=excluded.created_at;";

static constexpr const char* LIST_WATERMARK_PROPOSALS =
    "SELECT chain,value,created_at FROM watermark_proposals ORDER BY chain;";

static constexpr const char* DELETE_WATERMARK_PROPOSAL =
    "DELETE FROM watermark_proposals WHERE chain=?;";

static constexpr const char* SELECT_WATERMARK =
    "SELECT chain,value,committed_at FROM watermarks WHERE chain=?;";

static constexpr const char* UPSERT_WATERMARK =
    "INSERT INTO watermarks(chain,value,committed_at) VALUES(?,?,?)"
    " ON CONFLICT(chain) DO UPDATE SET value=excluded.value, committed_at=excluded.committed_at;";

// fees

static constexpr const char* INSERT_FEE_ENTRY =
    "INSERT INTO fee_entries(source_ref,kind,amount_token_units,amount_register_units,created_at) VALUES(?,?,?,?,?);";

static constexpr const char* LIST_FEE_ENTRIES =
    "SELECT id,source_ref,kind,amount_token_units,amount_register_units,created_at FROM fee_entries ORDER BY id;";

static constexpr const char* UPSERT_FEE_SUMMARY =
    "INSERT INTO fee_summary(id,token_units_total,register_units_total,entry_count,refreshed_at) VALUES(1,?,?,?,?)"
    " ON CONFLICT(id) DO UPDATE SET token_units_total=excluded.token_units_total,"
    " register_units_total=excluded.register_units_total,"
    " entry_count=excluded.entry_count,"
    " refreshed_at=excluded.refreshed_at;";

static constexpr const char* SELECT_FEE_SUMMARY =
    "SELECT token_units_total,register_units_total,entry_count,refreshed_at FROM fee_summary WHERE id=1;";

} // namespace settle::db::sql
