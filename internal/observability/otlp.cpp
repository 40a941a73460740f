#include "internal/observability/otlp.hpp"

#include <cstdlib>

#include "config/config.pb.h"

namespace trajectory::observability {

OtlpConfig ResolveOtlpConfig(const trajectory::runtime::config::RuntimeConfig& config) {
  const auto& section = config.observability();

  OtlpConfig otlp;
  otlp.endpoint  = section.otlp_endpoint();
  otlp.transport = section.transport() == trajectory::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf : OtlpTransport::kGrpc;
  otlp.use_tls   = section.use_tls();
  if (!section.service_name().empty()) {
    otlp.service_name = section.service_name();
  }
  return otlp;
}

std::string ResolveEndpoint(const OtlpConfig& config, Signal signal) {
  if (!config.endpoint.empty()) {
    return config.endpoint;
  }

  const char* signal_variable = signal == Signal::kTraces ? "OTEL_EXPORTER_OTLP_TRACES_ENDPOINT" : "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT";
  for (const char* variable : {signal_variable, "OTEL_EXPORTER_OTLP_ENDPOINT"}) {
    const char* value = std::getenv(variable);
    if (value != nullptr && *value != '\0') {
      return value;
    }
  }

  if (config.transport == OtlpTransport::kGrpc) {
    return "localhost:4317";
  }
  return signal == Signal::kTraces ? "http://localhost:4318/v1/traces" : "http://localhost:4318/v1/metrics";
}

} // namespace trajectory::observability
