#include "internal/observability/otlp_settings.hpp"

#include <cassert>
#include <cstdlib>
#include <iostream>

#include "config/config.pb.h"

namespace {

using rulebook::observability::OtlpSignal;
using rulebook::observability::OtlpTransport;
using rulebook::observability::ResolveOtlpConfig;
using rulebook::runtime::config::ObservabilityConfig;

void ClearEnv() {
  unsetenv("OTEL_EXPORTER_OTLP_ENDPOINT");
  unsetenv("OTEL_EXPORTER_OTLP_TRACES_ENDPOINT");
  unsetenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT");
}

void TestDefaultsPerTransport() {
  ClearEnv();
  ObservabilityConfig observability;

  auto grpc = ResolveOtlpConfig(observability, OtlpSignal::kTraces);
  assert(grpc.transport == OtlpTransport::kGrpc);
  assert(grpc.endpoint == "localhost:4317");
  assert(grpc.service_name == "rulebook-ingest");

  observability.set_transport(rulebook::runtime::config::OTLP_TRANSPORT_HTTP);
  assert(ResolveOtlpConfig(observability, OtlpSignal::kTraces).endpoint == "http://localhost:4318/v1/traces");
  assert(ResolveOtlpConfig(observability, OtlpSignal::kMetrics).endpoint == "http://localhost:4318/v1/metrics");
}

void TestEnvironmentPrecedence() {
  ClearEnv();
  ObservabilityConfig observability;

  setenv("OTEL_EXPORTER_OTLP_ENDPOINT", "collector:4317", 1);
  assert(ResolveOtlpConfig(observability, OtlpSignal::kMetrics).endpoint == "collector:4317");

  setenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT", "metrics:4317", 1);
  assert(ResolveOtlpConfig(observability, OtlpSignal::kMetrics).endpoint == "metrics:4317");
  assert(ResolveOtlpConfig(observability, OtlpSignal::kTraces).endpoint == "collector:4317");

  observability.set_otlp_endpoint("configured:4317");
  observability.set_service_name("ingest-east");
  auto resolved = ResolveOtlpConfig(observability, OtlpSignal::kMetrics);
  assert(resolved.endpoint == "configured:4317");
  assert(resolved.service_name == "ingest-east");
  ClearEnv();
}

void TestEmptyEnvironmentValueIsIgnored() {
  ClearEnv();
  setenv("OTEL_EXPORTER_OTLP_TRACES_ENDPOINT", "", 1);
  ObservabilityConfig observability;
  assert(ResolveOtlpConfig(observability, OtlpSignal::kTraces).endpoint == "localhost:4317");
  ClearEnv();
}

} // namespace

int main() {
  TestDefaultsPerTransport();
  TestEnvironmentPrecedence();
  TestEmptyEnvironmentValueIsIgnored();
  std::cout << "rulebook_unit_otlp_settings: pass\n";
  return 0;
}
