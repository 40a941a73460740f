#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/noop.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span_context.h>

#include <array>
#include <mutex>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/otlp.hpp"

namespace trajectory::observability {
namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;

namespace {

constexpr const char* kInstrumentationName    = "trajectory-tracer";
constexpr const char* kInstrumentationVersion = "0.1.0";

std::mutex                                g_mutex;
std::shared_ptr<sdktrace::TracerProvider> g_provider;

opentelemetry::nostd::shared_ptr<trace_api::Tracer> Tracer() {
  return trace_api::Provider::GetTracerProvider()->GetTracer(kInstrumentationName, kInstrumentationVersion);
}

std::unique_ptr<sdktrace::SpanExporter> MakeExporter(const OtlpConfig& config) {
  const auto endpoint = ResolveEndpoint(config, Signal::kTraces);
  if (config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpExporterOptions options;
    options.url = endpoint;
    return otlp::OtlpHttpExporterFactory::Create(options);
  }
  otlp::OtlpGrpcExporterOptions options;
  options.endpoint            = endpoint;
  options.use_ssl_credentials = config.use_tls;
  return otlp::OtlpGrpcExporterFactory::Create(options);
}

template <std::size_t N>
std::string ToHex(const std::array<std::uint8_t, N>& bytes) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string out;
  out.reserve(N * 2);
  for (auto b : bytes) {
    out.push_back(kDigits[b >> 4]);
    out.push_back(kDigits[b & 0x0F]);
  }
  return out;
}

template <std::size_t N>
bool FromHex(const std::string& hex, std::array<std::uint8_t, N>& bytes) {
  auto nibble = [](char c) -> int {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
  };
  if (hex.size() != N * 2) return false;
  for (std::size_t i = 0; i < N; ++i) {
    const int hi = nibble(hex[2 * i]);
    const int lo = nibble(hex[2 * i + 1]);
    if (hi < 0 || lo < 0) return false;
    bytes[i] = static_cast<std::uint8_t>((hi << 4) | lo);
  }
  return true;
}

} // namespace

bool InitializeTracing(const trajectory::runtime::config::RuntimeConfig& config) {
  if (!config.observability().tracing_enabled()) {
    ShutdownTracing();
    return false;
  }

  const auto otlp_config = ResolveOtlpConfig(config);
  auto       processor   = sdktrace::BatchSpanProcessorFactory::Create(MakeExporter(otlp_config), sdktrace::BatchSpanProcessorOptions{});
  opentelemetry::sdk::resource::ResourceAttributes attributes = {{"service.name", otlp_config.service_name}};
  auto resource = opentelemetry::sdk::resource::Resource::Create(attributes);

  std::shared_ptr<sdktrace::TracerProvider> provider = sdktrace::TracerProviderFactory::Create(std::move(processor), resource);
  {
    std::lock_guard lock(g_mutex);
    g_provider = provider;
  }
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(provider));

  TRAJECTORY_LOG_INFO("tracing enabled", {StringField("endpoint", ResolveEndpoint(otlp_config, Signal::kTraces)),
                                          StringField("service", otlp_config.service_name)});
  return true;
}

void ShutdownTracing() {
  std::shared_ptr<sdktrace::TracerProvider> provider;
  {
    std::lock_guard lock(g_mutex);
    provider.swap(g_provider);
  }
  if (!provider) {
    return;
  }
  provider->ForceFlush();
  provider->Shutdown();
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(new trace_api::NoopTracerProvider()));
}

TraceParent CurrentTraceParent() {
  auto span    = trace_api::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  auto context = span->GetContext();
  if (!context.IsValid()) {
    return {};
  }

  std::array<std::uint8_t, trace_api::TraceId::kSize> trace_bytes{};
  std::array<std::uint8_t, trace_api::SpanId::kSize>  span_bytes{};
  context.trace_id().CopyBytesTo(trace_bytes);
  context.span_id().CopyBytesTo(span_bytes);
  return {ToHex(trace_bytes), ToHex(span_bytes)};
}

struct SpanScope::Impl {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  std::unique_ptr<trace_api::Scope>                 scope;
};

SpanScope::SpanScope(std::string_view name) : SpanScope(name, TraceParent{}) {
}

SpanScope::SpanScope(std::string_view name, const TraceParent& parent) : impl_(std::make_unique<Impl>()) {
  auto tracer = Tracer();

  trace_api::StartSpanOptions options;
  std::array<std::uint8_t, trace_api::TraceId::kSize> trace_bytes{};
  std::array<std::uint8_t, trace_api::SpanId::kSize>  span_bytes{};
  if (parent.valid() && FromHex(parent.trace_id, trace_bytes) && FromHex(parent.span_id, span_bytes)) {
    options.parent = trace_api::SpanContext(trace_api::TraceId(trace_bytes), trace_api::SpanId(span_bytes),
                                            trace_api::TraceFlags(trace_api::TraceFlags::kIsSampled), false);
  }

  impl_->span  = tracer->StartSpan(std::string(name), options);
  impl_->scope = std::make_unique<trace_api::Scope>(tracer->WithActiveSpan(impl_->span));
}

SpanScope::~SpanScope() {
  if (!impl_) {
    return;
  }
  impl_->scope.reset();
  impl_->span->End();
}

SpanScope::SpanScope(SpanScope&&) noexcept            = default;
SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

void SpanScope::SetAttribute(std::string_view key, std::string_view value) {
  if (impl_) impl_->span->SetAttribute(std::string(key), std::string(value));
}

void SpanScope::SetAttribute(std::string_view key, std::int64_t value) {
  if (impl_) impl_->span->SetAttribute(std::string(key), value);
}

void SpanScope::SetAttribute(std::string_view key, double value) {
  if (impl_) impl_->span->SetAttribute(std::string(key), value);
}

void SpanScope::AddEvent(std::string_view name) {
  if (impl_) impl_->span->AddEvent(std::string(name));
}

void SpanScope::RecordException(std::string_view description) {
  if (!impl_) {
    return;
  }
  impl_->span->AddEvent("exception", {{"exception.message", std::string(description)}});
  impl_->span->SetStatus(trace_api::StatusCode::kError, std::string(description));
}

} // namespace trajectory::observability

#endif
