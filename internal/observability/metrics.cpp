#include "internal/observability/metrics.hpp"

#ifdef SETTLE_ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#if __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>)
#define SETTLE_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>)
#define SETTLE_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>)
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>
#else
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader.h>
#endif
#include <opentelemetry/sdk/resource/resource.h>

#include "config/config.pb.h"
#include "internal/util/time.hpp"

namespace settle::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {

using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
using Int64Observer = opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>;

constexpr const char*               kServiceName      = "swap-settlement";
constexpr std::chrono::milliseconds kDefaultExportGap = std::chrono::seconds(10);

std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

// Config wins over the standard OTEL_* variables.
std::string CollectorUrl(const settle::runtime::config::MetricsConfig& config) {
  if (!config.otlp_endpoint().empty()) return config.otlp_endpoint();
  for (const char* name : {"OTEL_EXPORTER_OTLP_METRICS_ENDPOINT", "OTEL_EXPORTER_OTLP_ENDPOINT"}) {
    if (const char* value = std::getenv(name)) return value;
  }
  return "http://localhost:4318/v1/metrics";
}

std::unique_ptr<sdkmetrics::MetricReader> MakeReader(const settle::runtime::config::MetricsConfig& config) {
  otlp::OtlpHttpMetricExporterOptions exporter_options;
  exporter_options.url = CollectorUrl(config);

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = kDefaultExportGap;
  if (config.has_export_interval()) {
    const auto interval = util::ToMillis(config.export_interval());
    if (interval.count() > 0) reader_options.export_interval_millis = interval;
  }

  auto exporter = otlp::OtlpHttpMetricExporterFactory::Create(exporter_options);
#ifdef SETTLE_OTEL_METRIC_READER_FACTORY
  return sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);
#else
  return std::make_unique<sdkmetrics::PeriodicExportingMetricReader>(std::move(exporter), reader_options);
#endif
}

// SDK releases differ in whether AddMetricReader takes unique_ptr or shared_ptr.
template <typename Provider>
void AttachReader(Provider& provider, std::unique_ptr<sdkmetrics::MetricReader> reader) {
  if constexpr (requires { provider.AddMetricReader(std::move(reader)); }) {
    provider.AddMetricReader(std::move(reader));
  } else {
    provider.AddMetricReader(std::shared_ptr<sdkmetrics::MetricReader>(std::move(reader)));
  }
}

// Same story for the context parameter on synchronous instruments.
template <typename Instrument, typename Value>
void Emit(Instrument& instrument, Value value, std::initializer_list<AttributePair> attributes) {
  if constexpr (requires { instrument.Add(value, attributes, opentelemetry::context::Context{}); }) {
    instrument.Add(value, attributes, opentelemetry::context::Context{});
  } else if constexpr (requires { instrument.Add(value, attributes); }) {
    instrument.Add(value, attributes);
  } else if constexpr (requires { instrument.Record(value, attributes, opentelemetry::context::Context{}); }) {
    instrument.Record(value, attributes, opentelemetry::context::Context{});
  } else {
    instrument.Record(value, attributes);
  }
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> pass_items;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      pass_duration_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>   backing_ratio;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>   stuck_items;

  std::atomic<std::int64_t> last_ratio_bps{0};

  std::mutex                          stuck_mutex;
  std::map<std::string, std::int64_t> stuck_by_direction;

  static void ObserveRatio(metrics_api::ObserverResult result, void* state) {
    const auto* impl = static_cast<const Impl*>(state);
    opentelemetry::nostd::get<Int64Observer>(result)->Observe(impl->last_ratio_bps.load());
  }

  static void ObserveStuck(metrics_api::ObserverResult result, void* state) {
    auto*                       impl = static_cast<Impl*>(state);
    std::lock_guard<std::mutex> lock(impl->stuck_mutex);
    auto                        observer = opentelemetry::nostd::get<Int64Observer>(result);
    for (const auto& [direction, count] : impl->stuck_by_direction) {
      observer->Observe(count, std::initializer_list<AttributePair>{{"direction", direction}});
    }
  }
};

bool InitializeMetrics(const settle::runtime::config::RuntimeConfig& config) {
  if (!config.metrics().enabled()) {
    ShutdownMetrics();
    return false;
  }

  auto service = resource::Resource::Create(resource::ResourceAttributes{{"service.name", kServiceName}});
  g_provider   = std::make_shared<sdkmetrics::MeterProvider>(std::make_unique<sdkmetrics::ViewRegistry>(), service);
  AttachReader(*g_provider, MakeReader(config.metrics()));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

void ShutdownMetrics() {
  if (!g_provider) return;
  g_provider->ForceFlush();
  g_provider->Shutdown();
  g_provider.reset();
}

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  impl_->meter = metrics_api::Provider::GetMeterProvider()->GetMeter(kServiceName, "0.1.0");

  impl_->pass_items       = impl_->meter->CreateUInt64Counter("settle.pass.items", "Items leaving an advancement pass, by outcome", "1");
  impl_->pass_duration_ms = impl_->meter->CreateDoubleHistogram("settle.pass.duration_ms", "Advancement pass wall-clock time", "ms");

  impl_->backing_ratio = impl_->meter->CreateInt64ObservableGauge("settle.backing.ratio_bps", "Collateral to liability ratio", "bps");
  impl_->backing_ratio->AddCallback(&Impl::ObserveRatio, impl_.get());

  impl_->stuck_items = impl_->meter->CreateInt64ObservableGauge("settle.items.stuck", "Open items waiting on an operator", "1");
  impl_->stuck_items->AddCallback(&Impl::ObserveStuck, impl_.get());
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordPassItems(std::string_view direction, std::string_view outcome, std::uint64_t count) {
  if (count == 0) return;
  const std::string direction_value(direction);
  const std::string outcome_value(outcome);
  Emit(*impl_->pass_items, count, {{"direction", direction_value}, {"outcome", outcome_value}});
}

void Metrics::ObservePassDurationMs(std::string_view pass, double duration_ms) {
  const std::string pass_value(pass);
  Emit(*impl_->pass_duration_ms, duration_ms, {{"pass", pass_value}});
}

void Metrics::SetBackingRatioBps(std::int64_t ratio_bps) {
  impl_->last_ratio_bps.store(ratio_bps);
}

void Metrics::SetStuckItems(std::string_view direction, std::uint64_t count) {
  std::lock_guard<std::mutex> lock(impl_->stuck_mutex);
  impl_->stuck_by_direction[std::string(direction)] = static_cast<std::int64_t>(count);
}

} // namespace settle::observability

#endif
