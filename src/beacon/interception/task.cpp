/**
 * @file task.cpp
 * @brief TaskId generation and SessionTask accessors.
 */
#include "beacon/interception/task.hpp"

#include <atomic>
#include <utility>

namespace beacon::interception {

namespace {
std::atomic<TaskId> g_next_task_id{1};  // 0 is reserved for "no task"
}

SessionTask::SessionTask(std::optional<net::HttpRequest> original_request)
  : id_(g_next_task_id.fetch_add(1, std::memory_order_relaxed)),
    original_request_(std::move(original_request)) {}

std::optional<net::HttpResponse> SessionTask::response() const {
  std::lock_guard<std::mutex> lk(mu_);
  return response_;
}

void SessionTask::set_response(net::HttpResponse response) {
  std::lock_guard<std::mutex> lk(mu_);
  response_ = std::move(response);
}

} // namespace beacon::interception
