#include "internal/observability/metrics.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/metrics/view/view_registry.h>
#include <opentelemetry/sdk/resource/resource.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <string>
#include <utility>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"

namespace tally::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;

constexpr const char* kServiceName = "tally";
constexpr const char* kVersion     = "0.1.0";

std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

std::string ResolveEndpoint(const tally::runtime::config::MetricsConfig& config) {
  if (!config.otlp_endpoint().empty()) {
    return config.otlp_endpoint();
  }

  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT")) {
    return endpoint;
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    return endpoint;
  }

  return config.transport() == tally::runtime::config::OTLP_TRANSPORT_HTTP ? "http://localhost:4318/v1/metrics" : "localhost:4317";
}

std::unique_ptr<sdkmetrics::PushMetricExporter> BuildExporter(const tally::runtime::config::MetricsConfig& config) {
  const auto endpoint = ResolveEndpoint(config);

  if (config.transport() == tally::runtime::config::OTLP_TRANSPORT_HTTP) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }

  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = endpoint;
  options.use_ssl_credentials = false;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

template <typename Instrument, typename Value, typename Attributes>
void AddWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Add(value, std::forward<Attributes>(attributes));
  }
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> operations;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      drain_duration_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>   queue_depth;

  std::atomic<std::int64_t> pending{0};
  std::atomic<std::int64_t> exhausted{0};
};

bool InitializeMetrics(const tally::runtime::config::RuntimeConfig& config) {
  const auto& metrics = config.metrics();
  if (!metrics.enabled()) {
    ShutdownMetrics();
    return false;
  }

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  const auto interval_ms                = metrics.collection_interval_ms() > 0 ? metrics.collection_interval_ms() : 10000;
  reader_options.export_interval_millis = std::chrono::milliseconds(interval_ms);
  if (metrics.export_timeout_ms() > 0) {
    reader_options.export_timeout_millis = std::chrono::milliseconds(std::min(metrics.export_timeout_ms(), interval_ms));
  }

  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(BuildExporter(metrics), reader_options);

  resource::ResourceAttributes attrs = {{"service.name", kServiceName}};
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::make_unique<sdkmetrics::ViewRegistry>(), resource::Resource::Create(attrs));
  g_provider->AddMetricReader(std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));

  TALLY_LOG_INFO("metrics export enabled", {StringField("endpoint", ResolveEndpoint(metrics)),
                                            IntField("interval_ms", static_cast<int64_t>(interval_ms))});
  return true;
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto provider = metrics_api::Provider::GetMeterProvider();
  impl_->meter  = provider->GetMeter(kServiceName, kVersion);

  impl_->operations = impl_->meter->CreateUInt64Counter("tally.sync.operations", "Sync queue entries processed", "1");
  impl_->drain_duration_ms =
      impl_->meter->CreateDoubleHistogram("tally.sync.drain.duration_ms", "Wall time of one sync drain", "ms");
  impl_->queue_depth = impl_->meter->CreateInt64ObservableGauge("tally.sync.queue.depth", "Sync queue entries not yet completed", "1");
  impl_->queue_depth->AddCallback(
      [](metrics_api::ObserverResult result, void* state) {
        auto* impl       = static_cast<Impl*>(state);
        auto  int_result = opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(result);

        const std::initializer_list<AttributePair> pending   = {{"state", "pending"}};
        const std::initializer_list<AttributePair> exhausted = {{"state", "exhausted"}};
        int_result->Observe(impl->pending.load(), pending);
        int_result->Observe(impl->exhausted.load(), exhausted);
      },
      impl_.get());
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordOperation(std::string_view table, std::string_view operation, std::string_view outcome) {
  if (!impl_ || !impl_->operations) {
    return;
  }

  const std::string table_value(table);
  const std::string operation_value(operation);
  const std::string outcome_value(outcome);

  const std::initializer_list<AttributePair> attributes = {
      {"table", table_value}, {"operation", operation_value}, {"outcome", outcome_value}};
  AddWithAttributes(impl_->operations, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveDrainDurationMs(double duration_ms) {
  if (!impl_ || !impl_->drain_duration_ms) {
    return;
  }
  impl_->drain_duration_ms->Record(duration_ms, opentelemetry::context::Context{});
}

void Metrics::SetQueueDepth(std::uint64_t pending, std::uint64_t exhausted) {
  if (!impl_) {
    return;
  }
  impl_->pending.store(static_cast<std::int64_t>(pending));
  impl_->exhausted.store(static_cast<std::int64_t>(exhausted));
}

} // namespace tally::observability

#endif
