#pragma once

#include <string>
#include <vector>

namespace settle::db::sql {

/*
  Bootstrap DDL for the persistent store.

  One open and one terminal table per direction. Every money column is
  a 64-bit integer in base units; no column stores a floating point
  amount.
*/

inline const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kStatements = {
      "CREATE TABLE IF NOT EXISTS token_deposits (id TEXT PRIMARY KEY, detected_at INTEGER NOT NULL, source_address TEXT NOT NULL, owner TEXT NOT NULL, amount_units INTEGER NOT NULL, memo TEXT NOT NULL, status TEXT NOT NULL, destination TEXT NOT NULL DEFAULT '', transfer_id TEXT NOT NULL DEFAULT '', note TEXT NOT NULL DEFAULT '', status_since INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS register_credits (id TEXT PRIMARY KEY, detected_at INTEGER NOT NULL, source_address TEXT NOT NULL, owner TEXT NOT NULL, amount_units INTEGER NOT NULL, memo TEXT NOT NULL, status TEXT NOT NULL, destination TEXT NOT NULL DEFAULT '', transfer_id TEXT NOT NULL DEFAULT '', note TEXT NOT NULL DEFAULT '', status_since INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS token_deposits_detected_at ON token_deposits(detected_at, id);",
      "CREATE INDEX IF NOT EXISTS register_credits_detected_at ON register_credits(detected_at, id);",
      "CREATE TABLE IF NOT EXISTS token_deposits_done (id TEXT PRIMARY KEY, outcome TEXT NOT NULL, detected_at INTEGER NOT NULL, source_address TEXT NOT NULL, amount_units INTEGER NOT NULL, payout_units INTEGER NOT NULL, fee_units INTEGER NOT NULL, destination TEXT NOT NULL, transfer_id TEXT NOT NULL, reason TEXT NOT NULL, completed_at INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS register_credits_done (id TEXT PRIMARY KEY, outcome TEXT NOT NULL, detected_at INTEGER NOT NULL, source_address TEXT NOT NULL, amount_units INTEGER NOT NULL, payout_units INTEGER NOT NULL, fee_units INTEGER NOT NULL, destination TEXT NOT NULL, transfer_id TEXT NOT NULL, reason TEXT NOT NULL, completed_at INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS reservations (kind TEXT NOT NULL, key TEXT NOT NULL, holder TEXT NOT NULL, expires_at INTEGER NOT NULL, PRIMARY KEY (kind, key));",
      "CREATE TABLE IF NOT EXISTS attempts (action_key TEXT PRIMARY KEY, count INTEGER NOT NULL, last_attempt_at INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS watermark_proposals (chain TEXT PRIMARY KEY, value INTEGER NOT NULL, created_at INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS watermarks (chain TEXT PRIMARY KEY, value INTEGER NOT NULL, committed_at INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS fee_entries (id INTEGER PRIMARY KEY AUTOINCREMENT, source_ref TEXT NOT NULL, kind TEXT NOT NULL, amount_token_units INTEGER NOT NULL, amount_register_units INTEGER NOT NULL, created_at INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS fee_summary (id INTEGER PRIMARY KEY CHECK (id = 1), token_units_total INTEGER NOT NULL, register_units_total INTEGER NOT NULL, entry_count INTEGER NOT NULL, refreshed_at INTEGER NOT NULL);"};
  return kStatements;
}

inline const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kStatements = {
      "CREATE TABLE IF NOT EXISTS token_deposits (id TEXT PRIMARY KEY, detected_at BIGINT NOT NULL, source_address TEXT NOT NULL, owner TEXT NOT NULL, amount_units BIGINT NOT NULL, memo TEXT NOT NULL, status TEXT NOT NULL, destination TEXT NOT NULL DEFAULT '', transfer_id TEXT NOT NULL DEFAULT '', note TEXT NOT NULL DEFAULT '', status_since BIGINT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS register_credits (id TEXT PRIMARY KEY, detected_at BIGINT NOT NULL, source_address TEXT NOT NULL, owner TEXT NOT NULL, amount_units BIGINT NOT NULL, memo TEXT NOT NULL, status TEXT NOT NULL, destination TEXT NOT NULL DEFAULT '', transfer_id TEXT NOT NULL DEFAULT '', note TEXT NOT NULL DEFAULT '', status_since BIGINT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS token_deposits_detected_at ON token_deposits(detected_at, id);",
      "CREATE INDEX IF NOT EXISTS register_credits_detected_at ON register_credits(detected_at, id);",
      "CREATE TABLE IF NOT EXISTS token_deposits_done (id TEXT PRIMARY KEY, outcome TEXT NOT NULL, detected_at BIGINT NOT NULL, source_address TEXT NOT NULL, amount_units BIGINT NOT NULL, payout_units BIGINT NOT NULL, fee_units BIGINT NOT NULL, destination TEXT NOT NULL, transfer_id TEXT NOT NULL, reason TEXT NOT NULL, completed_at BIGINT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS register_credits_done (id TEXT PRIMARY KEY, outcome TEXT NOT NULL, detected_at BIGINT NOT NULL, source_address TEXT NOT NULL, amount_units BIGINT NOT NULL, payout_units BIGINT NOT NULL, fee_units BIGINT NOT NULL, destination TEXT NOT NULL, transfer_id TEXT NOT NULL, reason TEXT NOT NULL, completed_at BIGINT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS reservations (kind TEXT NOT NULL, key TEXT NOT NULL, holder TEXT NOT NULL, expires_at BIGINT NOT NULL, PRIMARY KEY (kind, key));",
      "CREATE TABLE IF NOT EXISTS attempts (action_key TEXT PRIMARY KEY, count INTEGER NOT NULL, last_attempt_at BIGINT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS watermark_proposals (chain TEXT PRIMARY KEY, value BIGINT NOT NULL, created_at BIGINT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS watermarks (chain TEXT PRIMARY KEY, value BIGINT NOT NULL, committed_at BIGINT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS fee_entries (id BIGSERIAL PRIMARY KEY, source_ref TEXT NOT NULL, kind TEXT NOT NULL, amount_token_units BIGINT NOT NULL, amount_register_units BIGINT NOT NULL, created_at BIGINT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS fee_summary (id SMALLINT PRIMARY KEY CHECK (id = 1), token_units_total BIGINT NOT NULL, register_units_total BIGINT NOT NULL, entry_count BIGINT NOT NULL, refreshed_at BIGINT NOT NULL);"};
  return kStatements;
}

} // namespace settle::db::sql
