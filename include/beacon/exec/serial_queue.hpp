/**
 * @file serial_queue.hpp
 * @brief Single-lane FIFO work queue backed by one worker thread.
 *
 * Semantics:
 *  - async(): enqueue and return immediately (fire and forget).
 *  - sync():  enqueue and block until the job ran; returns its result.
 *  - Jobs run one at a time, in enqueue order, on the worker thread. Any state
 *    touched only from jobs needs no further locking.
 *
 * Lifetime:
 *  - The destructor stops intake, drains every queued job, then joins.
 *  - sync() called from a job runs inline (no self-deadlock).
 */
#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>
#include <utility>

namespace beacon::exec {

class SerialQueue final {
public:
  using Job = std::function<void()>;

  /// @brief Start the worker. @p label identifies the queue in error reports.
  explicit SerialQueue(std::string_view label);

  /// @brief Drain outstanding jobs, then join the worker.
  ~SerialQueue();

  SerialQueue(const SerialQueue&)            = delete;
  SerialQueue& operator=(const SerialQueue&) = delete;

  /**
   * @brief Enqueue @p job and return without waiting.
   * A job that throws is reported on stderr; the queue keeps running.
   */
  void async(Job job);

  /**
   * @brief Enqueue @p fn and wait for its result.
   * Exceptions thrown by @p fn propagate to the caller.
   */
  template <class F>
  auto sync(F&& fn) -> std::invoke_result_t<F> {
    using R = std::invoke_result_t<F>;
    if (runs_on_worker()) return std::forward<F>(fn)();

    auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
    std::future<R> done = task->get_future();
    enqueue([task] { (*task)(); });
    return done.get();
  }

  /// @brief Block until every job enqueued before this call has run.
  void flush() { sync([] {}); }

  /// @brief True when called from this queue's worker thread.
  bool runs_on_worker() const noexcept { return std::this_thread::get_id() == worker_id_; }

  const std::string& label() const noexcept { return label_; }

private:
  void enqueue(Job job);
  void run();

  std::string             label_;
  std::mutex              mu_;
  std::condition_variable cv_;
  std::deque<Job>         jobs_;        ///< Guarded by mu_
  bool                    stopping_{false};
  std::thread::id         worker_id_{};
  std::thread             worker_;      ///< Declared last: starts after the state above
};

} // namespace beacon::exec
