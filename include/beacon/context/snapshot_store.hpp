/**
 * @file snapshot_store.hpp
 * @brief Eventually-consistent aggregate of session context, readable
 *        synchronously from any thread.
 *
 * Concurrency model: one SerialQueue owns the stored ContextSnapshot.
 *   • Each source change enqueues a narrow single-field write.
 *   • current() is a synchronous round trip on the same queue, so a read is
 *     never interleaved with a write and always returns a real point-in-time value.
 *   • Fields are updated independently; a snapshot may pair a fresh field with
 *     a stale one. Consumers must tolerate that.
 */
#pragma once

#include <functional>
#include <memory>
#include <optional>

#include "beacon/context/context_snapshot.hpp"
#include "beacon/context/value_publisher.hpp"

namespace beacon::context {

/// @brief The publishers a SnapshotStore follows. Must outlive construction only.
struct SnapshotSources {
  ValuePublisher<TrackingConsent>&                      tracking_consent;
  ValuePublisher<UserInfo>&                             user_info;
  ValuePublisher<std::optional<NetworkConnectionInfo>>& network_connection_info;
  ValuePublisher<std::optional<CarrierInfo>>&           carrier_info;
  ValuePublisher<std::optional<ViewEvent>>&             last_view_event;
};

class SnapshotStore final {
public:
  /// Receives the whole snapshot after every single-field update (on the store's queue).
  using ChangeCallback = std::function<void(const ContextSnapshot&)>;

  /**
   * @brief Subscribe to every source, then seed the snapshot from their current values.
   * The store may be destroyed before the publishers; later changes are then dropped.
   */
  explicit SnapshotStore(const SnapshotSources& sources);
  ~SnapshotStore();

  SnapshotStore(const SnapshotStore&)            = delete;
  SnapshotStore& operator=(const SnapshotStore&) = delete;

  /// @brief Consistent point-in-time copy (blocks for queued writes ahead of it).
  [[nodiscard]] ContextSnapshot current() const;

  /// @brief Install or clear the change callback.
  void set_on_change(ChangeCallback cb);

  /// @brief Wait until every update enqueued so far has been applied.
  void flush() const;

private:
  struct State;

  /// Apply `write(snapshot, new_value)` on the store queue whenever `source` changes.
  template <class T, class Write>
  static void watch(ValuePublisher<T>& source, const std::weak_ptr<State>& weak, Write write);

  std::shared_ptr<State> state_;
};

} // namespace beacon::context
