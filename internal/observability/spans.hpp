#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace artifact::runtime::config {
class RuntimeConfig;
}

namespace artifact::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

// Exporter settings shared by the trace and metric pipelines.
struct OtlpConfig {
  std::string   service_name{"artifact-manager"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
};

OtlpConfig OtlpConfigFrom(const artifact::runtime::config::RuntimeConfig& config);

// false when tracing is disabled in the config or the build
bool InitializeTracing(const artifact::runtime::config::RuntimeConfig& config);
void ShutdownTracing();

/*
  RAII span around one unit of work (an RPC, a job execution, a version
  append). The span is active on the current thread until destruction, so
  log lines written meanwhile can carry its trace and span ids.
*/
class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);

  // marks the span as failed
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline OtlpConfig OtlpConfigFrom(const artifact::runtime::config::RuntimeConfig&) {
  return {};
}

inline bool InitializeTracing(const artifact::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline SpanScope::SpanScope(SpanScope&&) noexcept = default;

inline SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::RecordException(std::string_view) {
}
#endif

} // namespace artifact::observability
