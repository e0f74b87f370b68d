#pragma once

#include <memory>
#include <string>

#include "config/config.pb.h"

#include "internal/chain/ledger_adapter.hpp"
#include "internal/chain/watermark_publisher.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/engine/engine_options.hpp"
#include "internal/engine/settlement_engine.hpp"
#include "internal/scheduler/poll_scheduler.hpp"
#include "internal/util/time.hpp"

namespace settle::factory {

/*
  Application

  Owns all long-lived components of the settlement process.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::Repository>            repository;
  std::shared_ptr<engine::SettlementEngine>  engine;
  std::shared_ptr<scheduler::PollScheduler>  scheduler;
};

// The only place that knows concrete store types. Creates the schema.
std::shared_ptr<db::Repository> BuildRepository(const settle::runtime::config::RuntimeConfig& config);

engine::EngineOptions BuildEngineOptions(const settle::runtime::config::RuntimeConfig& config);

// Reservation holder for this process: the configured name, the host,
// the pid and a random id, so two workers sharing a name never release
// each other's reservations.
std::string ProcessHolder(const std::string& name);

scheduler::SchedulerOptions BuildSchedulerOptions(const settle::runtime::config::RuntimeConfig& config);

/*
  Build

  Composition root. Ledger adapters and the watermark publisher are
  chain-specific and supplied by the caller. The scheduler is returned
  stopped; the engine has already run Recover().
*/
Application Build(const settle::runtime::config::RuntimeConfig& config, std::shared_ptr<chain::LedgerAdapter> token_ledger,
                  std::shared_ptr<chain::LedgerAdapter> register_ledger, std::shared_ptr<chain::WatermarkPublisher> publisher,
                  std::shared_ptr<const util::TimeSource> clock = std::make_shared<util::SystemTimeSource>());

} // namespace settle::factory
