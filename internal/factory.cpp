#include "internal/factory.hpp"

#include <unistd.h>

#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/uuid.hpp"
#if SETTLE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if SETTLE_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace settle::factory {

using settle::runtime::config::RuntimeConfig;

namespace {

#if SETTLE_DB_POSTGRES
// Runs on its own connection: pooled connections prepare statements
// against the tables on connect.
void BootstrapPostgresSchema(const std::string& connection_uri) {
  pqxx::connection conn(connection_uri);
  pqxx::work       tx(conn);
  for (const auto& sql : db::sql::PostgresSchema()) {
    tx.exec(sql);
  }
  tx.commit();
}
#endif

engine::LedgerOptions ToLedgerOptions(const settle::runtime::config::LedgerConfig& ledger) {
  engine::LedgerOptions options;
  options.name  = ledger.name();
  options.asset = ledger.asset();
  if (ledger.has_decimals()) options.decimals = ledger.decimals();
  options.quarantine_account = ledger.quarantine_account();
  return options;
}

fees::FeeSchedule ToFeeSchedule(const settle::runtime::config::FeeSchedule& schedule) {
  fees::FeeSchedule out;
  out.flat_fee_units    = schedule.flat_fee_units();
  out.dynamic_fee_bps   = schedule.dynamic_fee_bps();
  out.min_deposit_units = schedule.min_deposit_units();
  out.refund_fee_units  = schedule.refund_fee_units();
  return out;
}

template <typename T>
void SetIfPositive(T& target, T value) {
  if (value > T{}) target = value;
}

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if SETTLE_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    sqlite_db->ApplySchema(db::sql::SqliteSchema());
    SETTLE_LOG_INFO("store opened", {observability::StringField("backend", "sqlite"),
                                     observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if SETTLE_DB_POSTGRES
    BootstrapPostgresSchema(database.postgres().connection_uri());
    const std::size_t max_connections = database.postgres().max_connections() == 0 ? 16 : database.postgres().max_connections();
    auto pool = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections,
                                                       &db::postgres::PgRepository::PrepareStatements);
    SETTLE_LOG_INFO("store opened", {observability::StringField("backend", "postgres")});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  SETTLE_LOG_WARN("no database configured; state is kept in memory only");
  return std::make_shared<db::memory::MemoryRepository>();
}

engine::EngineOptions BuildEngineOptions(const RuntimeConfig& config) {
  engine::EngineOptions options;

  options.token_ledger    = ToLedgerOptions(config.token_ledger());
  options.register_ledger = ToLedgerOptions(config.register_ledger());
  if (options.token_ledger.name.empty()) options.token_ledger.name = "token";
  if (options.register_ledger.name.empty()) options.register_ledger.name = "register";

  options.token_deposit_fees   = ToFeeSchedule(config.fees().token_deposit());
  options.register_credit_fees = ToFeeSchedule(config.fees().register_credit());

  const auto& retry = config.retry();
  SetIfPositive(options.max_attempts, retry.max_attempts());
  SetIfPositive(options.quarantine_max_attempts, retry.quarantine_max_attempts());
  if (retry.has_cooldown()) options.cooldown_seconds = util::ToSeconds(retry.cooldown());

  const auto& timeouts = config.timeouts();
  if (timeouts.has_mapping_timeout()) options.mapping_timeout_seconds = util::ToSeconds(timeouts.mapping_timeout());
  if (timeouts.has_confirmation_timeout()) options.confirmation_timeout_seconds = util::ToSeconds(timeouts.confirmation_timeout());

  const auto& reservations = config.reservations();
  if (reservations.has_ttl()) SetIfPositive(options.reservation_ttl_seconds, util::ToSeconds(reservations.ttl()));
  if (!reservations.holder().empty()) options.holder = reservations.holder();

  const auto& polling = config.scheduler();
  if (polling.has_pass_budget()) SetIfPositive(options.pass_budget, util::ToMillis(polling.pass_budget()));
  SetIfPositive(options.max_items_per_pass, polling.max_items_per_pass());

  const auto& scan = config.watermark();
  if (scan.has_safety_margin()) options.watermark.safety_margin_seconds = util::ToSeconds(scan.safety_margin());
  if (scan.has_max_lookback()) SetIfPositive(options.watermark.max_lookback_seconds, util::ToSeconds(scan.max_lookback()));
  if (scan.has_min_publish_interval()) {
    options.watermark.min_publish_interval_seconds = std::max<std::int64_t>(0, util::ToSeconds(scan.min_publish_interval()));
  }

  const auto& backing = config.backing();
  if (backing.has_pause_threshold_bps()) options.backing.pause_threshold_bps = backing.pause_threshold_bps();
  options.backing.pause_redemptions = backing.pause_redemptions();
  options.backing.token_decimals    = options.token_ledger.decimals;
  options.backing.register_decimals = options.register_ledger.decimals;

  if (!config.memo().destination_prefix().empty()) options.destination_prefix = config.memo().destination_prefix();

  return options;
}

scheduler::SchedulerOptions BuildSchedulerOptions(const RuntimeConfig& config) {
  scheduler::SchedulerOptions options;
  const auto&                 polling = config.scheduler();
  if (polling.has_token_poll_interval()) SetIfPositive(options.token_deposit_interval, util::ToMillis(polling.token_poll_interval()));
  if (polling.has_register_poll_interval())
    SetIfPositive(options.register_credit_interval, util::ToMillis(polling.register_poll_interval()));
  if (polling.has_maintenance_interval()) SetIfPositive(options.maintenance_interval, util::ToMillis(polling.maintenance_interval()));
  return options;
}

std::string ProcessHolder(const std::string& name) {
  char host[256] = {};
  if (gethostname(host, sizeof(host) - 1) != 0) {
    host[0] = '\0';
  }
  const std::string hostname = host[0] != '\0' ? host : "unknown-host";
  return name + "@" + hostname + ":" + std::to_string(getpid()) + ":" + util::ToString(util::GenerateUUID());
}

/*
    Build full application dependency graph
*/
Application Build(const RuntimeConfig& config, std::shared_ptr<chain::LedgerAdapter> token_ledger,
                  std::shared_ptr<chain::LedgerAdapter> register_ledger, std::shared_ptr<chain::WatermarkPublisher> publisher,
                  std::shared_ptr<const util::TimeSource> clock) {
  if (!token_ledger || !register_ledger) {
    throw std::invalid_argument("both ledger adapters are required");
  }

  auto options   = BuildEngineOptions(config);
  options.holder = ProcessHolder(options.holder);
  SETTLE_LOG_INFO("reservation holder", {observability::StringField("holder", options.holder)});

  Application app;
  app.repository = BuildRepository(config);
  app.engine     = std::make_shared<engine::SettlementEngine>(app.repository, std::move(token_ledger), std::move(register_ledger),
                                                          std::move(publisher), std::move(clock), std::move(options));
  app.engine->Recover();
  app.scheduler = std::make_shared<scheduler::PollScheduler>(app.engine, BuildSchedulerOptions(config));
  return app;
}

} // namespace settle::factory
