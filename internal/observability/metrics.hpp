#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

namespace trajectory::runtime::config {
class RuntimeConfig;
}

namespace trajectory::observability {

bool InitializeMetrics(const trajectory::runtime::config::RuntimeConfig& config);
void ShutdownMetrics();

/*
  Process-wide instruments, all prefixed "trajectory.":
    invocation.count        {model, success}
    invocation.latency_ms   {model}
    embedding.count         {embedding_model, success}
    embedding.latency_ms    {embedding_model}
    run.finished            {outcome: duplicate|length_exhausted|failed}
    run.loop_length         cycle length of duplicate stops
    diagram.duration_ms

  Instruments bind to the meter provider current at first use, so call
  InitializeMetrics() before any run starts.
*/
class Metrics {
 public:
  static Metrics& Instance();

  void RecordInvocation(std::string_view model, bool success);
  void ObserveInvocationLatencyMs(std::string_view model, double latency_ms);
  void RecordEmbedding(std::string_view embedding_model, bool success);
  void ObserveEmbeddingLatencyMs(std::string_view embedding_model, double latency_ms);
  void RecordRunFinished(std::string_view outcome);
  void ObserveLoopLength(std::uint32_t loop_length);
  void ObserveDiagramDurationMs(double duration_ms);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  ~Metrics();
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeMetrics(const trajectory::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownMetrics() {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordInvocation(std::string_view, bool) {
}

inline void Metrics::ObserveInvocationLatencyMs(std::string_view, double) {
}

inline void Metrics::RecordEmbedding(std::string_view, bool) {
}

inline void Metrics::ObserveEmbeddingLatencyMs(std::string_view, double) {
}

inline void Metrics::RecordRunFinished(std::string_view) {
}

inline void Metrics::ObserveLoopLength(std::uint32_t) {
}

inline void Metrics::ObserveDiagramDurationMs(double) {
}
#endif

} // namespace trajectory::observability
