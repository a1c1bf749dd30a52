#pragma once

#include <chrono>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace warranty::service {

namespace detail {

inline void Finish(std::string_view route, bool ok, std::chrono::steady_clock::time_point started_at) {
  auto& metrics = warranty::observability::Metrics::Instance();
  metrics.RecordRequest(route, ok);
  metrics.ObserveRequestLatencyMs(route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
}

} // namespace detail

/*
  Runs one service call inside a span and records request count and
  latency for the route. Failures are logged and rethrown unchanged; the
  gRPC layer maps them to a status. Client errors log at WARN, anything
  unclassified at ERROR.
*/
template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view entity_id, Fn&& fn) {
  warranty::observability::SpanScope span(route);
  if (!entity_id.empty()) {
    span.SetAttribute("warranty.entity_id", entity_id);
  }

  const auto started_at = std::chrono::steady_clock::now();
  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      detail::Finish(route, true, started_at);
      return;
    } else {
      auto result = fn();
      detail::Finish(route, true, started_at);
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    const auto kind = warranty::util::ErrorKind(ex);
    if (kind == "internal") {
      WARRANTY_LOG_ERROR("RPC failed", {warranty::observability::StringField("route", route),
                                        warranty::observability::StringField("error", ex.what()),
                                        warranty::observability::StringField("entity_id", entity_id)});
    } else {
      WARRANTY_LOG_WARN("RPC rejected", {warranty::observability::StringField("route", route),
                                         warranty::observability::StringField("kind", kind),
                                         warranty::observability::StringField("error", ex.what()),
                                         warranty::observability::StringField("entity_id", entity_id)});
    }
    detail::Finish(route, false, started_at);
    throw;
  }
}

} // namespace warranty::service
