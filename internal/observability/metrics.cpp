#include "internal/observability/metrics.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/noop.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/resource/resource.h>

#include <chrono>
#include <mutex>
#include <string>
#include <utility>
#if __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>)
#define TRAJECTORY_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>)
#define TRAJECTORY_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#else
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader.h>
#endif

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/observability/otlp.hpp"

namespace trajectory::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;

namespace {

using Attribute  = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
using Attributes = std::initializer_list<Attribute>;

template <typename T>
using Counter = opentelemetry::nostd::shared_ptr<metrics_api::Counter<T>>;
template <typename T>
using Histogram = opentelemetry::nostd::shared_ptr<metrics_api::Histogram<T>>;

std::mutex                                 g_mutex;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

std::unique_ptr<sdkmetrics::PushMetricExporter> MakeExporter(const OtlpConfig& config) {
  const auto endpoint = ResolveEndpoint(config, Signal::kMetrics);
  if (config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }
  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = endpoint;
  options.use_ssl_credentials = config.use_tls;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

std::unique_ptr<sdkmetrics::MetricReader> MakeReader(std::unique_ptr<sdkmetrics::PushMetricExporter> exporter) {
  sdkmetrics::PeriodicExportingMetricReaderOptions options;
  options.export_interval_millis = std::chrono::milliseconds(1000);
#ifdef TRAJECTORY_OTEL_METRIC_READER_FACTORY
  return sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), options);
#else
  return std::make_unique<sdkmetrics::PeriodicExportingMetricReader>(std::move(exporter), options);
#endif
}

// SDK releases disagree on whether the context argument is required.
template <typename T, typename V>
void Add(const Counter<T>& counter, V value, Attributes attributes) {
  if constexpr (requires { counter->Add(value, attributes, opentelemetry::context::Context{}); }) {
    counter->Add(value, attributes, opentelemetry::context::Context{});
  } else {
    counter->Add(value, attributes);
  }
}

template <typename T, typename V>
void Record(const Histogram<T>& histogram, V value, Attributes attributes) {
  if constexpr (requires { histogram->Record(value, attributes, opentelemetry::context::Context{}); }) {
    histogram->Record(value, attributes, opentelemetry::context::Context{});
  } else {
    histogram->Record(value, attributes);
  }
}

} // namespace

struct Metrics::Impl {
  Counter<std::uint64_t>   invocations;
  Histogram<double>        invocation_latency_ms;
  Counter<std::uint64_t>   embeddings;
  Histogram<double>        embedding_latency_ms;
  Counter<std::uint64_t>   runs_finished;
  Histogram<std::uint64_t> loop_length;
  Histogram<double>        diagram_duration_ms;
};

bool InitializeMetrics(const trajectory::runtime::config::RuntimeConfig& config) {
  if (!config.observability().metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  const auto otlp_config = ResolveOtlpConfig(config);

  opentelemetry::sdk::resource::ResourceAttributes attributes = {{"service.name", otlp_config.service_name}};
  auto provider = std::make_shared<sdkmetrics::MeterProvider>(std::make_unique<sdkmetrics::ViewRegistry>(),
                                                              opentelemetry::sdk::resource::Resource::Create(attributes));
  auto reader = MakeReader(MakeExporter(otlp_config));
  if constexpr (requires { provider->AddMetricReader(std::move(reader)); }) {
    provider->AddMetricReader(std::move(reader));
  } else {
    provider->AddMetricReader(std::shared_ptr<sdkmetrics::MetricReader>(std::move(reader)));
  }
  {
    std::lock_guard lock(g_mutex);
    g_provider = provider;
  }
  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(provider));

  TRAJECTORY_LOG_INFO("metrics enabled", {StringField("endpoint", ResolveEndpoint(otlp_config, Signal::kMetrics)),
                                          StringField("service", otlp_config.service_name)});
  return true;
}

void ShutdownMetrics() {
  std::shared_ptr<sdkmetrics::MeterProvider> provider;
  {
    std::lock_guard lock(g_mutex);
    provider.swap(g_provider);
  }
  if (!provider) {
    return;
  }
  provider->ForceFlush();
  provider->Shutdown();
  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(new metrics_api::NoopMeterProvider()));
}

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto meter = metrics_api::Provider::GetMeterProvider()->GetMeter("trajectory-tracer", "0.1.0");

  impl_->invocations           = meter->CreateUInt64Counter("trajectory.invocation.count", "Generator invocations", "1");
  impl_->invocation_latency_ms = meter->CreateDoubleHistogram("trajectory.invocation.latency_ms", "Generator call latency", "ms");
  impl_->embeddings            = meter->CreateUInt64Counter("trajectory.embedding.count", "Embedding computations", "1");
  impl_->embedding_latency_ms  = meter->CreateDoubleHistogram("trajectory.embedding.latency_ms", "Embedding call latency", "ms");
  impl_->runs_finished         = meter->CreateUInt64Counter("trajectory.run.finished", "Runs reaching a terminal state", "1");
  impl_->loop_length           = meter->CreateUInt64Histogram("trajectory.run.loop_length", "Cycle length of runs stopped by a duplicate", "1");
  impl_->diagram_duration_ms   = meter->CreateDoubleHistogram("trajectory.diagram.duration_ms", "Persistence diagram build time", "ms");
}

Metrics::~Metrics() = default;

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordInvocation(std::string_view model, bool success) {
  Add(impl_->invocations, std::uint64_t{1}, {{"model", std::string(model)}, {"success", success}});
}

void Metrics::ObserveInvocationLatencyMs(std::string_view model, double latency_ms) {
  Record(impl_->invocation_latency_ms, latency_ms, {{"model", std::string(model)}});
}

void Metrics::RecordEmbedding(std::string_view embedding_model, bool success) {
  Add(impl_->embeddings, std::uint64_t{1}, {{"embedding_model", std::string(embedding_model)}, {"success", success}});
}

void Metrics::ObserveEmbeddingLatencyMs(std::string_view embedding_model, double latency_ms) {
  Record(impl_->embedding_latency_ms, latency_ms, {{"embedding_model", std::string(embedding_model)}});
}

void Metrics::RecordRunFinished(std::string_view outcome) {
  Add(impl_->runs_finished, std::uint64_t{1}, {{"outcome", std::string(outcome)}});
}

void Metrics::ObserveLoopLength(std::uint32_t loop_length) {
  Record(impl_->loop_length, static_cast<std::uint64_t>(loop_length), {});
}

void Metrics::ObserveDiagramDurationMs(double duration_ms) {
  Record(impl_->diagram_duration_ms, duration_ms, {});
}

} // namespace trajectory::observability

#endif
