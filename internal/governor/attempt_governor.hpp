#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace settle::governor {

/*
  AttemptGovernor

  Bounds retries of side-effecting actions (payout, refund, quarantine
  transfer). An action may run only while count < max_attempts AND the
  cooldown since the last attempt has elapsed.

  ShouldAttempt and RecordAttempt are separate calls; a race between two
  callers costs at most one extra attempt. Callers always record before
  acting.
*/
class AttemptGovernor {
 public:
  AttemptGovernor(std::shared_ptr<db::Repository> repository, std::shared_ptr<const util::TimeSource> clock, std::int64_t cooldown_seconds);

  // "<kind>:<action>:<id>", e.g. "token_deposit:payout:5xK..."
  static std::string Key(settle::model::ItemKind kind, std::string_view action, std::string_view id);

  bool ShouldAttempt(const std::string& action_key, std::uint32_t max_attempts);

  // Increments the count and stamps the time. Returns the new count.
  std::uint32_t RecordAttempt(const std::string& action_key);

  void Reset(const std::string& action_key);

  std::uint32_t Count(const std::string& action_key);

  bool Exhausted(const std::string& action_key, std::uint32_t max_attempts) { return Count(action_key) >= max_attempts; }

  std::int64_t CooldownSeconds() const { return cooldown_seconds_; }

 private:
  std::shared_ptr<db::Repository>         repository_;
  std::shared_ptr<const util::TimeSource> clock_;
  std::int64_t                            cooldown_seconds_;
};

} // namespace settle::governor
