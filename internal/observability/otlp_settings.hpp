#pragma once

#include <string>
#include <string_view>

namespace rulebook::runtime::config {
class ObservabilityConfig;
}

namespace rulebook::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

enum class OtlpSignal {
  kTraces,
  kMetrics,
};

struct OtlpConfig {
  std::string   service_name{"rulebook-ingest"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
};

/*
  Endpoint precedence: config, then the signal specific
  OTEL_EXPORTER_OTLP_<SIGNAL>_ENDPOINT, then OTEL_EXPORTER_OTLP_ENDPOINT,
  then the collector default for the transport.
*/
OtlpConfig ResolveOtlpConfig(const rulebook::runtime::config::ObservabilityConfig& observability, OtlpSignal signal);

std::string_view SignalName(OtlpSignal signal);

} // namespace rulebook::observability
