#pragma once

#include <chrono>
#include <string_view>
#include <type_traits>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace streamledger::service {

// Runs fn inside a span, records request count and latency for route, and
// logs then rethrows any failure.
template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view stream_id, Fn&& fn) {
  streamledger::observability::SpanScope span(route);
  if (!stream_id.empty()) {
    span.SetAttribute("stream.id", stream_id);
  }

  auto&      metrics    = streamledger::observability::Metrics::Instance();
  const auto started_at = std::chrono::steady_clock::now();
  const auto elapsed_ms = [&] {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      std::forward<Fn>(fn)();
      metrics.RecordRequest(route, true);
      metrics.ObserveRequestLatencyMs(route, elapsed_ms());
      return;
    } else {
      auto result = std::forward<Fn>(fn)();
      metrics.RecordRequest(route, true);
      metrics.ObserveRequestLatencyMs(route, elapsed_ms());
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    STREAMLEDGER_LOG_ERROR("RPC failed", {streamledger::observability::StringField("route", route),
                                          streamledger::observability::StringField("error", ex.what()),
                                          streamledger::observability::StringField("stream", stream_id)});
    metrics.RecordRequest(route, false);
    metrics.ObserveRequestLatencyMs(route, elapsed_ms());
    throw;
  }
}

} // namespace streamledger::service
