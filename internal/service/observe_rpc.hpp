#pragma once

#include <chrono>
#include <string_view>
#include <type_traits>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/observability/spans.hpp"

namespace artifact::service {

// Runs fn inside a span, records request count and latency for route and
// logs then rethrows any failure. subject names the job or artifact the
// call is about and may be empty.
template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view subject_key, std::string_view subject, Fn&& fn) {
  artifact::observability::SpanScope span(route);
  if (!subject.empty()) {
    span.SetAttribute(subject_key, subject);
  }

  const auto started_at = std::chrono::steady_clock::now();
  auto       record     = [&](bool success) {
    artifact::observability::Metrics::Instance().RecordRequest(route, success);
    artifact::observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      std::forward<Fn>(fn)();
      record(true);
      return;
    } else {
      auto result = std::forward<Fn>(fn)();
      record(true);
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    ARTIFACT_LOG_ERROR("RPC failed", {artifact::observability::StringField("route", route), artifact::observability::StringField("error", ex.what()),
                                      artifact::observability::StringField(subject_key.empty() ? "subject" : subject_key, subject)});
    record(false);
    throw;
  }
}

} // namespace artifact::service
