#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace settle::reservation {

/*
  Short-lived exclusive claims on (kind, key), persisted so that separate
  processes observe them.

  At most one live reservation per key. An expired row is replaced by
  the next Acquire, and swept periodically otherwise.
*/
class ReservationManager {
 public:
  ReservationManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<const util::TimeSource> clock, std::string holder);

  // False when a live reservation already exists for the key.
  bool Acquire(const std::string& kind, const std::string& key, std::int64_t ttl_seconds);

  // Removes the reservation if this holder owns it.
  void Release(const std::string& kind, const std::string& key);

  bool IsHeld(const std::string& kind, const std::string& key);

  std::uint64_t SweepExpired();

  const std::string& Holder() const { return holder_; }

 private:
  std::shared_ptr<db::Repository>         repository_;
  std::shared_ptr<const util::TimeSource> clock_;
  std::string                             holder_;
};

/*
  RAII guard. Releases on every exit path, including exceptions.
*/
class ScopedReservation {
 public:
  ScopedReservation(ReservationManager& manager, std::string kind, std::string key, std::int64_t ttl_seconds);
  ~ScopedReservation();

  ScopedReservation(const ScopedReservation&)            = delete;
  ScopedReservation& operator=(const ScopedReservation&) = delete;

  bool Held() const { return held_; }

 private:
  ReservationManager& manager_;
  std::string         kind_;
  std::string         key_;
  bool                held_ = false;
};

} // namespace settle::reservation
