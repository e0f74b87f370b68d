#include "internal/governor/attempt_governor.hpp"

#include "internal/db/api/throw_if_error.hpp"

namespace settle::governor {

AttemptGovernor::AttemptGovernor(std::shared_ptr<db::Repository> repository, std::shared_ptr<const util::TimeSource> clock,
                                 std::int64_t cooldown_seconds)
    : repository_(std::move(repository)), clock_(std::move(clock)), cooldown_seconds_(cooldown_seconds) {
}

std::string AttemptGovernor::Key(settle::model::ItemKind kind, std::string_view action, std::string_view id) {
  std::string key(settle::model::ToString(kind));
  key.append(":").append(action).append(":").append(id);
  return key;
}

bool AttemptGovernor::ShouldAttempt(const std::string& action_key, std::uint32_t max_attempts) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetAttempt(*tx, action_key);
  tx->Commit();

  if (!record.has_value()) return max_attempts > 0;
  if (record->count >= max_attempts) return false;
  return clock_->NowSeconds() - record->last_attempt_at >= cooldown_seconds_;
}

std::uint32_t AttemptGovernor::RecordAttempt(const std::string& action_key) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetAttempt(*tx, action_key);

  db::model::AttemptRecord updated;
  updated.action_key      = action_key;
  updated.count           = record.has_value() ? record->count + 1 : 1;
  updated.last_attempt_at = clock_->NowSeconds();
  db::ThrowIfDbError(repository_->UpsertAttempt(*tx, updated), "record attempt " + action_key);
  tx->Commit();
  return updated.count;
}

void AttemptGovernor::Reset(const std::string& action_key) {
  auto tx = repository_->Begin();
  db::ThrowIfDbError(repository_->DeleteAttempt(*tx, action_key), "reset attempts " + action_key);
  tx->Commit();
}

std::uint32_t AttemptGovernor::Count(const std::string& action_key) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetAttempt(*tx, action_key);
  tx->Commit();
  return record.has_value() ? record->count : 0;
}

} // namespace settle::governor
