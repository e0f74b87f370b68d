#include "internal/reservation/reservation_manager.hpp"

#include "internal/db/api/throw_if_error.hpp"
#include "internal/observability/logging.hpp"

namespace settle::reservation {

ReservationManager::ReservationManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<const util::TimeSource> clock,
                                       std::string holder)
    : repository_(std::move(repository)), clock_(std::move(clock)), holder_(std::move(holder)) {
}

bool ReservationManager::Acquire(const std::string& kind, const std::string& key, std::int64_t ttl_seconds) {
  const auto now = clock_->NowSeconds();

  auto tx       = repository_->Begin();
  auto existing = repository_->GetReservation(*tx, kind, key);
  if (existing.has_value()) {
    if (existing->expires_at > now) {
      tx->Rollback();
      return false;
    }
    db::ThrowIfDbError(repository_->DeleteReservation(*tx, kind, key), "acquire reservation " + kind + ":" + key);
  }

  db::model::ReservationRecord record;
  record.kind       = kind;
  record.key        = key;
  record.holder     = holder_;
  record.expires_at = now + ttl_seconds;

  const auto result = repository_->InsertReservation(*tx, record);
  if (result.code == db::ErrorCode::AlreadyExists) {
    tx->Rollback();
    return false;
  }
  db::ThrowIfDbError(result, "acquire reservation " + kind + ":" + key);
  tx->Commit();
  return true;
}

void ReservationManager::Release(const std::string& kind, const std::string& key) {
  auto tx       = repository_->Begin();
  auto existing = repository_->GetReservation(*tx, kind, key);
  if (!existing.has_value() || existing->holder != holder_) {
    tx->Rollback();
    return;
  }
  db::ThrowIfDbError(repository_->DeleteReservation(*tx, kind, key), "release reservation " + kind + ":" + key);
  tx->Commit();
}

bool ReservationManager::IsHeld(const std::string& kind, const std::string& key) {
  auto tx       = repository_->Begin();
  auto existing = repository_->GetReservation(*tx, kind, key);
  tx->Commit();
  return existing.has_value() && existing->expires_at > clock_->NowSeconds();
}

std::uint64_t ReservationManager::SweepExpired() {
  std::uint64_t removed = 0;

  auto tx = repository_->Begin();
  db::ThrowIfDbError(repository_->DeleteExpiredReservations(*tx, clock_->NowSeconds(), &removed), "sweep reservations");
  tx->Commit();

  if (removed > 0) {
    SETTLE_LOG_INFO("expired reservations swept", {observability::UintField("removed", removed)});
  }
  return removed;
}

ScopedReservation::ScopedReservation(ReservationManager& manager, std::string kind, std::string key, std::int64_t ttl_seconds)
    : manager_(manager), kind_(std::move(kind)), key_(std::move(key)) {
  held_ = manager_.Acquire(kind_, key_, ttl_seconds);
}

ScopedReservation::~ScopedReservation() {
  if (!held_) return;
  try {
    manager_.Release(kind_, key_);
  } catch (const std::exception& e) {
    // the row expires on its own; the sweep removes it
    SETTLE_LOG_ERROR("reservation release failed",
                     {observability::StringField("kind", kind_), observability::StringField("key", key_), observability::ErrorField(e)});
  }
}

} // namespace settle::reservation
