/**
 * @file task.hpp
 * @brief Transport-side task handle and the data its callbacks deliver.
 *
 * A SessionTask carries a correlation token (TaskId) generated at creation and
 * threaded through every lifecycle callback; the interceptor keys its records
 * by that token rather than by object address.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

#include "beacon/net/http.hpp"

namespace beacon::interception {

/// Stable, process-unique task identity.
using TaskId = std::uint64_t;

/// @brief Closed time interval measured by the transport.
struct DateInterval {
  std::chrono::system_clock::time_point start{};
  std::chrono::system_clock::time_point end{};

  std::chrono::nanoseconds duration() const noexcept { return end - start; }
  bool operator==(const DateInterval&) const = default;
};

/**
 * @brief Timing and transfer data of one task.
 * Phases the transport did not go through (reused connection, no TLS) stay empty.
 */
struct ResourceMetrics {
  DateInterval                 fetch;         ///< Whole task, first byte sent to last byte received
  std::optional<DateInterval>  redirection;
  std::optional<DateInterval>  dns;
  std::optional<DateInterval>  connect;
  std::optional<DateInterval>  ssl;
  std::optional<DateInterval>  first_byte;
  std::optional<DateInterval>  download;
  std::optional<std::uint64_t> response_size; ///< Decoded body bytes

  bool operator==(const ResourceMetrics&) const = default;
};

/// @brief Transport failure reported on completion.
struct TaskError {
  int         code{0};
  std::string domain;
  std::string description;

  bool operator==(const TaskError&) const = default;
};

/// @brief Outcome of a task: the response, an error, or both.
struct ResourceCompletion {
  std::optional<net::HttpResponse> response;
  std::optional<TaskError>         error;

  bool operator==(const ResourceCompletion&) const = default;
};

/**
 * @class SessionTask
 * @brief Handle the transport hands to the interceptor callbacks.
 *
 * Thread-safety: response() / set_response() may race (the transport fills
 * the response on its own thread); everything else is immutable.
 */
class SessionTask final {
public:
  /// Assigns a fresh TaskId. A task without an original request is never tracked.
  explicit SessionTask(std::optional<net::HttpRequest> original_request);

  SessionTask(const SessionTask&)            = delete;
  SessionTask& operator=(const SessionTask&) = delete;

  TaskId id() const noexcept { return id_; }
  const std::optional<net::HttpRequest>& original_request() const noexcept { return original_request_; }

  std::optional<net::HttpResponse> response() const;
  void set_response(net::HttpResponse response);

private:
  const TaskId                          id_;
  const std::optional<net::HttpRequest> original_request_;
  mutable std::mutex                    mu_;
  std::optional<net::HttpResponse>      response_;  ///< Guarded by mu_
};

} // namespace beacon::interception
