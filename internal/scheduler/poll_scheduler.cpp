#include "internal/scheduler/poll_scheduler.hpp"

#include "internal/observability/logging.hpp"

namespace settle::scheduler {

using settle::model::ItemKind;

PollScheduler::PollScheduler(std::shared_ptr<engine::SettlementEngine> engine, SchedulerOptions options)
    : engine_(std::move(engine)), options_(options) {
}

PollScheduler::~PollScheduler() {
  Stop();
}

void PollScheduler::Start() {
  std::lock_guard lock(mutex_);
  if (running_) return;
  running_  = true;
  stopping_ = false;
  engine_->ClearStop();

  threads_.emplace_back(&PollScheduler::RunDirection, this, ItemKind::kTokenDeposit, options_.token_deposit_interval);
  threads_.emplace_back(&PollScheduler::RunDirection, this, ItemKind::kRegisterCredit, options_.register_credit_interval);
  threads_.emplace_back(&PollScheduler::RunMaintenanceLoop, this);

  SETTLE_LOG_INFO("poll scheduler started",
                  {observability::IntField("token_deposit_interval_ms", options_.token_deposit_interval.count()),
                   observability::IntField("register_credit_interval_ms", options_.register_credit_interval.count()),
                   observability::IntField("maintenance_interval_ms", options_.maintenance_interval.count())});
}

void PollScheduler::Stop() {
  std::vector<std::thread> threads;
  {
    std::lock_guard lock(mutex_);
    if (!running_) return;
    stopping_ = true;
    threads.swap(threads_);
  }
  engine_->RequestStop();
  cv_.notify_all();

  for (auto& thread : threads) {
    if (thread.joinable()) thread.join();
  }

  std::lock_guard lock(mutex_);
  running_ = false;
  SETTLE_LOG_INFO("poll scheduler stopped");
}

bool PollScheduler::Running() const {
  std::lock_guard lock(mutex_);
  return running_ && !stopping_;
}

bool PollScheduler::SleepFor(std::chrono::milliseconds interval) {
  std::unique_lock lock(mutex_);
  return !cv_.wait_for(lock, interval, [&] { return stopping_; });
}

void PollScheduler::RunDirection(ItemKind kind, std::chrono::milliseconds interval) {
  do {
    try {
      engine_->RunDetectionPass(kind);
      if (engine_->StopRequested()) break;
      engine_->RunAdvancementPass(kind);
    } catch (const std::exception& e) {
      SETTLE_LOG_ERROR("settlement loop iteration failed",
                       {observability::StringField("kind", settle::model::ToString(kind)), observability::ErrorField(e)});
    }
  } while (SleepFor(interval));
}

void PollScheduler::RunMaintenanceLoop() {
  while (SleepFor(options_.maintenance_interval)) {
    try {
      engine_->RunMaintenance();
    } catch (const std::exception& e) {
      SETTLE_LOG_ERROR("maintenance iteration failed", {observability::ErrorField(e)});
    }
  }
}

CycleResult PollScheduler::RunCycle() {
  CycleResult result;
  result.token_detection    = engine_->RunDetectionPass(ItemKind::kTokenDeposit);
  result.token_pass         = engine_->RunAdvancementPass(ItemKind::kTokenDeposit);
  result.register_detection = engine_->RunDetectionPass(ItemKind::kRegisterCredit);
  result.register_pass      = engine_->RunAdvancementPass(ItemKind::kRegisterCredit);
  result.maintenance        = engine_->RunMaintenance();
  return result;
}

} // namespace settle::scheduler
