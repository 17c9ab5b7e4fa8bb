#include "internal/observability/spans.hpp"

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
#include <opentelemetry/sdk/resource/resource.h>

#include <chrono>
#include <utility>

#include "config/config.pb.h"

namespace rulebook::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {

using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
using Attributes    = std::initializer_list<AttributePair>;

constexpr std::uint32_t kDefaultExportIntervalMs = 5000;

std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

std::unique_ptr<sdkmetrics::PushMetricExporter> MakeMetricExporter(const OtlpConfig& otlp_config) {
  if (otlp_config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = otlp_config.endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }
  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = otlp_config.endpoint;
  options.use_ssl_credentials = !otlp_config.insecure;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

/*
  opentelemetry-cpp changed AddMetricReader from shared_ptr to unique_ptr and
  added the context argument to Add/Record across releases.
*/
template <typename Provider>
void AttachReader(const std::shared_ptr<Provider>& provider, std::unique_ptr<sdkmetrics::MetricReader> reader) {
  if constexpr (requires { provider->AddMetricReader(std::move(reader)); }) {
    provider->AddMetricReader(std::move(reader));
  } else {
    provider->AddMetricReader(std::shared_ptr<sdkmetrics::MetricReader>(std::move(reader)));
  }
}

template <typename Counter, typename Value>
void Increment(const opentelemetry::nostd::shared_ptr<Counter>& counter, Value value, Attributes attributes) {
  if (!counter) {
    return;
  }
  if constexpr (requires { counter->Add(value, attributes, opentelemetry::context::Context{}); }) {
    counter->Add(value, attributes, opentelemetry::context::Context{});
  } else {
    counter->Add(value, attributes);
  }
}

template <typename Histogram>
void Observe(const opentelemetry::nostd::shared_ptr<Histogram>& histogram, double value, Attributes attributes) {
  if (!histogram) {
    return;
  }
  if constexpr (requires { histogram->Record(value, attributes, opentelemetry::context::Context{}); }) {
    histogram->Record(value, attributes, opentelemetry::context::Context{});
  } else {
    histogram->Record(value, attributes);
  }
}

} // namespace

bool InitializeMetrics(const rulebook::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  const auto otlp_config = ResolveOtlpConfig(observability, OtlpSignal::kMetrics);

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = std::chrono::milliseconds(
      observability.metrics_interval_ms() > 0 ? observability.metrics_interval_ms() : kDefaultExportIntervalMs);

  const resource::ResourceAttributes attrs = {{"service.name", otlp_config.service_name}};
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::make_unique<sdkmetrics::ViewRegistry>(), resource::Resource::Create(attrs));
  AttachReader(g_provider, sdkmetrics::PeriodicExportingMetricReaderFactory::Create(MakeMetricExporter(otlp_config), reader_options));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

void ShutdownMetrics() {
  if (!g_provider) {
    return;
  }
  g_provider->ForceFlush();
  g_provider->Shutdown();
  g_provider.reset();
}

// ------------------------------------------------------------
// Metrics
// ------------------------------------------------------------

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> rpc_requests;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      rpc_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> job_outcomes;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      job_duration_ms;
};

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  impl_->meter = metrics_api::Provider::GetMeterProvider()->GetMeter("rulebook-ingest", "0.1.0");

  impl_->rpc_requests    = impl_->meter->CreateUInt64Counter("rulebook.rpc.requests", "1", "gRPC requests by route and result");
  impl_->rpc_latency_ms  = impl_->meter->CreateDoubleHistogram("rulebook.rpc.latency_ms", "ms", "gRPC handler latency");
  impl_->job_outcomes    = impl_->meter->CreateUInt64Counter("rulebook.job.outcomes", "1", "Processing job outcomes by result");
  impl_->job_duration_ms = impl_->meter->CreateDoubleHistogram("rulebook.job.duration_ms", "ms", "Time spent processing one job");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  Increment(impl_->rpc_requests, std::uint64_t{1}, {{"route", std::string(route)}, {"success", success}});
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  Observe(impl_->rpc_latency_ms, latency_ms, {{"route", std::string(route)}});
}

void Metrics::RecordJobOutcome(std::string_view outcome) {
  Increment(impl_->job_outcomes, std::uint64_t{1}, {{"outcome", std::string(outcome)}});
}

void Metrics::ObserveJobDurationMs(double duration_ms) {
  Observe(impl_->job_duration_ms, duration_ms, {});
}

} // namespace rulebook::observability

#endif
