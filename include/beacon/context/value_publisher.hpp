/**
 * @file value_publisher.hpp
 * @brief Thread-safe single-value holder with change notification.
 *
 * Design goals:
 *  - get() never observes a half-assigned value: the value lives behind a
 *    short mutex-guarded critical section (copy in, copy out).
 *  - set() publishes first, then notifies. Subscribers run on the setter's
 *    thread outside the value lock, so a subscriber may call get() (or set()
 *    on the same thread) without deadlocking. Subscribers are expected to
 *    hand heavy work to their own queue.
 *  - Notifications are delivered in swap order: racing setters are
 *    serialized across swap + notify, so a follower that applies updates in
 *    arrival order ends on the value get() returns.
 *  - Fixed topology: subscribers attach while the owner is wired up and are
 *    never detached.
 *
 * @tparam T Value type. Must be copyable.
 */
#pragma once

#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace beacon::context {

template <class T>
class ValuePublisher final {
public:
  using value_type = T;
  /// Invoked with (old_value, new_value) after the new value is visible.
  using Subscriber = std::function<void(const T&, const T&)>;

  explicit ValuePublisher(T initial) : value_(std::move(initial)) {}

  ValuePublisher(const ValuePublisher&)            = delete;
  ValuePublisher& operator=(const ValuePublisher&) = delete;

  /// @brief Current value (copy).
  T get() const {
    std::lock_guard<std::mutex> lk(mu_);
    return value_;
  }

  /**
   * @brief Replace the value and notify every subscriber with (old, new).
   * A racing setter waits until this call has notified every subscriber.
   */
  void set(T new_value) {
    std::lock_guard<std::recursive_mutex> order(notify_mu_);
    std::vector<Subscriber> subs;
    const T old_value = [&] {
      std::lock_guard<std::mutex> lk(mu_);
      subs = subscribers_;
      return std::exchange(value_, new_value);
    }();
    for (const auto& s : subs) s(old_value, new_value);
  }

  /// @brief Register @p subscriber for all future changes.
  void subscribe(Subscriber subscriber) {
    std::lock_guard<std::mutex> lk(mu_);
    subscribers_.push_back(std::move(subscriber));
  }

  /// @brief Number of registered subscribers (observer).
  std::size_t subscriber_count() const {
    std::lock_guard<std::mutex> lk(mu_);
    return subscribers_.size();
  }

private:
  std::recursive_mutex    notify_mu_;  ///< Held across swap + notify; recursive for re-entrant set()
  mutable std::mutex      mu_;
  T                       value_;
  std::vector<Subscriber> subscribers_;
};

} // namespace beacon::context
