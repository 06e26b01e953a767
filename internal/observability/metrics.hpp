#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

namespace artifact::runtime::config {
class RuntimeConfig;
}

namespace artifact::observability {

bool InitializeMetrics(const artifact::runtime::config::RuntimeConfig& config);
void ShutdownMetrics();

/*
  Process-wide instruments.

  Instruments bind to the meter provider installed when Instance() is first
  called; without ENABLE_OTEL every call is a no-op.
*/
class Metrics {
 public:
  static Metrics& Instance();

  // rpc surface
  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);

  // generation jobs; status is the terminal status name
  void RecordJobOutcome(std::string_view artifact_type, std::string_view status);
  void ObserveJobDurationMs(std::string_view artifact_type, double duration_ms);
  void SetJobQueueDepth(std::uint64_t depth);

  void RecordVersionAppend(bool success);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeMetrics(const artifact::runtime::config::RuntimeConfig&) {
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

inline void Metrics::RecordRequest(std::string_view, bool) {
}

inline void Metrics::ObserveRequestLatencyMs(std::string_view, double) {
}

inline void Metrics::RecordJobOutcome(std::string_view, std::string_view) {
}

inline void Metrics::ObserveJobDurationMs(std::string_view, double) {
}

inline void Metrics::SetJobQueueDepth(std::uint64_t) {
}

inline void Metrics::RecordVersionAppend(bool) {
}
#endif

} // namespace artifact::observability
