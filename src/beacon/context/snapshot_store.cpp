/**
 * @file snapshot_store.cpp
 * @brief SnapshotStore: per-field updaters funnelled through one SerialQueue.
 */
#include "beacon/context/snapshot_store.hpp"

#include "beacon/config/constants.hpp"
#include "beacon/exec/serial_queue.hpp"

namespace beacon::context {

struct SnapshotStore::State {
  ContextSnapshot   snapshot;   ///< Touched only from `queue` jobs
  ChangeCallback    on_change;  ///< Touched only from `queue` jobs
  // Declared last so it is destroyed first: pending jobs drain while the
  // members above are still alive.
  exec::SerialQueue queue{config::constants::CONTEXT_QUEUE_LABEL};
};

template <class T, class Write>
void SnapshotStore::watch(ValuePublisher<T>& source, const std::weak_ptr<State>& weak, Write write) {
  source.subscribe([weak, write](const T&, const T& new_value) {
    const auto st = weak.lock();
    if (!st) return;  // store already gone
    auto* raw = st.get();
    raw->queue.async([raw, write, new_value] {
      write(raw->snapshot, new_value);
      if (raw->on_change) raw->on_change(raw->snapshot);
    });
  });
}

SnapshotStore::SnapshotStore(const SnapshotSources& sources)
  : state_(std::make_shared<State>())
{
  std::weak_ptr<State> weak = state_;

  watch(sources.tracking_consent, weak,
        [](ContextSnapshot& s, const TrackingConsent& v) { s.tracking_consent = v; });
  watch(sources.user_info, weak,
        [](ContextSnapshot& s, const UserInfo& v) { s.user_info = v; });
  watch(sources.network_connection_info, weak,
        [](ContextSnapshot& s, const std::optional<NetworkConnectionInfo>& v) { s.network_connection_info = v; });
  watch(sources.carrier_info, weak,
        [](ContextSnapshot& s, const std::optional<CarrierInfo>& v) { s.carrier_info = v; });
  watch(sources.last_view_event, weak,
        [](ContextSnapshot& s, const std::optional<ViewEvent>& v) { s.last_view_event = v; });

  // Seed after subscribing: a change racing with construction is either read
  // here or applied by its own queued update afterwards.
  state_->queue.sync([&] {
    auto& s = state_->snapshot;
    s.tracking_consent        = sources.tracking_consent.get();
    s.user_info               = sources.user_info.get();
    s.network_connection_info = sources.network_connection_info.get();
    s.carrier_info            = sources.carrier_info.get();
    s.last_view_event         = sources.last_view_event.get();
  });
}

SnapshotStore::~SnapshotStore() = default;

ContextSnapshot SnapshotStore::current() const {
  return state_->queue.sync([this] { return state_->snapshot; });
}

void SnapshotStore::set_on_change(ChangeCallback cb) {
  state_->queue.sync([this, &cb] { state_->on_change = std::move(cb); });
}

void SnapshotStore::flush() const {
  state_->queue.flush();
}

} // namespace beacon::context
