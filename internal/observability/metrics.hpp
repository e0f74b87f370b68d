#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

namespace settle::runtime::config {
class RuntimeConfig;
}

namespace settle::observability {

bool InitializeMetrics(const settle::runtime::config::RuntimeConfig& config);
void ShutdownMetrics();

/*
  Process-wide settlement instruments.

  Without SETTLE_ENABLE_OTEL every call is an inline no-op.
*/
class Metrics {
 public:
  static Metrics& Instance();

  // Items that left an advancement pass with the given outcome label
  // ("processed", "fee_only", "deferred", "errored", ...).
  void RecordPassItems(std::string_view direction, std::string_view outcome, std::uint64_t count);
  void ObservePassDurationMs(std::string_view pass, double duration_ms);
  void SetBackingRatioBps(std::int64_t ratio_bps);
  void SetStuckItems(std::string_view direction, std::uint64_t count);

 private:
  Metrics();
#ifdef SETTLE_ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef SETTLE_ENABLE_OTEL
inline bool InitializeMetrics(const settle::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownMetrics() {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordPassItems(std::string_view, std::string_view, std::uint64_t) {
}

inline void Metrics::ObservePassDurationMs(std::string_view, double) {
}

inline void Metrics::SetBackingRatioBps(std::int64_t) {
}

inline void Metrics::SetStuckItems(std::string_view, std::uint64_t) {
}
#endif

} // namespace settle::observability
