#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace trajectory::runtime::config {
class RuntimeConfig;
}

namespace trajectory::observability {

bool InitializeTracing(const trajectory::runtime::config::RuntimeConfig& config);
void ShutdownTracing();

/*
  Span identity that can cross a thread boundary. Work queued onto another
  thread captures CurrentTraceParent() at submit time and opens its span
  with it, so pool work nests under the run that requested it.
*/
struct TraceParent {
  std::string trace_id; // 32 lowercase hex digits
  std::string span_id;  // 16 lowercase hex digits

  bool valid() const {
    return trace_id.size() == 32 && span_id.size() == 16;
  }
};

// Active span of the calling thread; empty without one.
TraceParent CurrentTraceParent();

/*
  RAII span, active on the constructing thread until destruction. Without
  ENABLE_OTEL every member is an inline no-op.
*/
class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  SpanScope(std::string_view name, const TraceParent& parent);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void SetAttribute(std::string_view key, double value);
  void AddEvent(std::string_view name);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const trajectory::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline TraceParent CurrentTraceParent() {
  return {};
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::SpanScope(std::string_view, const TraceParent&) {
}

inline SpanScope::~SpanScope() {
}

inline SpanScope::SpanScope(SpanScope&&) noexcept = default;

inline SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::SetAttribute(std::string_view, double) {
}

inline void SpanScope::AddEvent(std::string_view) {
}

inline void SpanScope::RecordException(std::string_view) {
}
#endif

} // namespace trajectory::observability
