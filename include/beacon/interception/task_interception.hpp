/**
 * @file task_interception.hpp
 * @brief Accumulated state of one intercepted task.
 *
 * Owned and mutated only by the Interceptor, from its serial queue. Handlers
 * receive it by const reference and copy what they keep.
 *
 * Completion rule: is_done() iff both metrics and completion were registered,
 * in whichever order they arrived.
 */
#pragma once

#include <optional>

#include "beacon/interception/task.hpp"
#include "beacon/net/http.hpp"
#include "beacon/tracing/tracer.hpp"

namespace beacon::interception {

class TaskInterception final {
public:
  TaskInterception(TaskId task_id, net::HttpRequest request, bool is_first_party);

  TaskId                                    task_id() const noexcept { return task_id_; }
  const net::HttpRequest&                   request() const noexcept { return request_; }
  bool                                      is_first_party() const noexcept { return is_first_party_; }
  const std::optional<tracing::SpanContext>& span_context() const noexcept { return span_context_; }
  const std::optional<ResourceMetrics>&     metrics() const noexcept { return metrics_; }
  const std::optional<ResourceCompletion>&  completion() const noexcept { return completion_; }

  /// Attach the propagated span context. Ignored (returns false) once set or once done.
  bool register_span_context(const tracing::SpanContext& ctx) noexcept;

  /// Record metrics. A repeated call overwrites (last write wins).
  void register_metrics(ResourceMetrics metrics);

  /// Record the outcome. A repeated call overwrites (last write wins).
  void register_completion(ResourceCompletion completion);

  bool is_done() const noexcept { return metrics_.has_value() && completion_.has_value(); }

private:
  TaskId                              task_id_;
  net::HttpRequest                    request_;
  bool                                is_first_party_;
  std::optional<tracing::SpanContext> span_context_;
  std::optional<ResourceMetrics>      metrics_;
  std::optional<ResourceCompletion>   completion_;
};

} // namespace beacon::interception
