/**
 * @file task_interception.cpp
 * @brief TaskInterception registration rules.
 */
#include "beacon/interception/task_interception.hpp"

#include <utility>

namespace beacon::interception {

TaskInterception::TaskInterception(TaskId task_id, net::HttpRequest request, bool is_first_party)
  : task_id_(task_id),
    request_(std::move(request)),
    is_first_party_(is_first_party) {}

bool TaskInterception::register_span_context(const tracing::SpanContext& ctx) noexcept {
  if (span_context_ || is_done()) return false;
  span_context_ = ctx;
  return true;
}

void TaskInterception::register_metrics(ResourceMetrics metrics) {
  metrics_ = std::move(metrics);
}

void TaskInterception::register_completion(ResourceCompletion completion) {
  completion_ = std::move(completion);
}

} // namespace beacon::interception
