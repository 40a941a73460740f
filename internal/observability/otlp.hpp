#pragma once

#include <string>

namespace trajectory::runtime::config {
class RuntimeConfig;
}

namespace trajectory::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

enum class Signal {
  kTraces,
  kMetrics,
};

struct OtlpConfig {
  std::string   service_name{"trajectory-tracer"};
  std::string   endpoint{}; // empty: environment, then transport default
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          use_tls{false};
};

OtlpConfig ResolveOtlpConfig(const trajectory::runtime::config::RuntimeConfig& config);

/*
  Exporter endpoint for one signal, first match wins:
    1. OtlpConfig::endpoint
    2. OTEL_EXPORTER_OTLP_{TRACES,METRICS}_ENDPOINT
    3. OTEL_EXPORTER_OTLP_ENDPOINT
    4. localhost:4317 for gRPC, http://localhost:4318/v1/{traces,metrics} for HTTP
*/
std::string ResolveEndpoint(const OtlpConfig& config, Signal signal);

} // namespace trajectory::observability
