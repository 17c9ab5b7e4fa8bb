#include "internal/observability/otlp_settings.hpp"

#include <cstdlib>

#include "config/config.pb.h"

namespace rulebook::observability {

namespace {

const char* EnvOrNull(const char* name) {
  const char* value = std::getenv(name);
  return (value && *value) ? value : nullptr;
}

std::string DefaultEndpoint(OtlpTransport transport, OtlpSignal signal) {
  if (transport == OtlpTransport::kGrpc) {
    return "localhost:4317";
  }
  return signal == OtlpSignal::kTraces ? "http://localhost:4318/v1/traces" : "http://localhost:4318/v1/metrics";
}

} // namespace

std::string_view SignalName(OtlpSignal signal) {
  return signal == OtlpSignal::kTraces ? "traces" : "metrics";
}

OtlpConfig ResolveOtlpConfig(const rulebook::runtime::config::ObservabilityConfig& observability, OtlpSignal signal) {
  OtlpConfig out;
  out.transport = observability.transport() == rulebook::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf
                                                                                             : OtlpTransport::kGrpc;
  if (!observability.service_name().empty()) {
    out.service_name = observability.service_name();
  }

  const char* signal_env = signal == OtlpSignal::kTraces ? "OTEL_EXPORTER_OTLP_TRACES_ENDPOINT" : "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT";

  if (!observability.otlp_endpoint().empty()) {
    out.endpoint = observability.otlp_endpoint();
  } else if (const char* endpoint = EnvOrNull(signal_env)) {
    out.endpoint = endpoint;
  } else if (const char* endpoint = EnvOrNull("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    out.endpoint = endpoint;
  } else {
    out.endpoint = DefaultEndpoint(out.transport, signal);
  }
  return out;
}

} // namespace rulebook::observability
