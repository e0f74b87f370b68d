#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "internal/engine/settlement_engine.hpp"

namespace settle::scheduler {

struct SchedulerOptions {
  std::chrono::milliseconds token_deposit_interval{15000};
  std::chrono::milliseconds register_credit_interval{15000};
  std::chrono::milliseconds maintenance_interval{60000};
};

struct CycleResult {
  engine::DetectionResult   token_detection;
  engine::PassResult        token_pass;
  engine::DetectionResult   register_detection;
  engine::PassResult        register_pass;
  engine::MaintenanceResult maintenance;
};

/*
  Background loops driving the engine.

  One thread per direction runs detection followed by advancement, and
  one thread runs maintenance. Each loop sleeps for its interval and is
  woken early by Stop(). Stop() also asks the engine to end its running
  pass after the current item.
*/
class PollScheduler {
 public:
  PollScheduler(std::shared_ptr<engine::SettlementEngine> engine, SchedulerOptions options);
  ~PollScheduler();

  PollScheduler(const PollScheduler&)            = delete;
  PollScheduler& operator=(const PollScheduler&) = delete;

  void Start();
  void Stop();

  bool Running() const;

  // One synchronous round of every loop body, in order.
  CycleResult RunCycle();

 private:
  void RunDirection(settle::model::ItemKind kind, std::chrono::milliseconds interval);
  void RunMaintenanceLoop();

  // False once stopping.
  bool SleepFor(std::chrono::milliseconds interval);

  std::shared_ptr<engine::SettlementEngine> engine_;
  SchedulerOptions                          options_;

  mutable std::mutex       mutex_;
  std::condition_variable  cv_;
  bool                     running_  = false;
  bool                     stopping_ = false;
  std::vector<std::thread> threads_;
};

} // namespace settle::scheduler
