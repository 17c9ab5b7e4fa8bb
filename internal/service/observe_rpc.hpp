#pragma once

#include <chrono>
#include <exception>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace rulebook::service {

// Span + request metrics around one RPC body; exceptions are logged and rethrown.
template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view subject_key, std::string_view subject, Fn&& fn) {
  rulebook::observability::SpanScope span(route);
  if (!subject.empty()) {
    span.SetAttribute(subject_key, subject);
  }

  const auto started_at = std::chrono::steady_clock::now();
  const auto finish     = [&](bool ok) {
    rulebook::observability::Metrics::Instance().RecordRequest(route, ok);
    rulebook::observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      finish(true);
      return;
    } else {
      auto result = fn();
      finish(true);
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    RULEBOOK_LOG_ERROR("RPC failed", {rulebook::observability::StringField("route", route), rulebook::observability::StringField("error", ex.what()),
                                      rulebook::observability::StringField(subject_key, subject)});
    finish(false);
    throw;
  }
}

} // namespace rulebook::service
