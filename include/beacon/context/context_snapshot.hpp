/**
 * @file context_snapshot.hpp
 * @brief Cross-cutting session context attached to out-of-band artifacts
 *        (crash reports and the like).
 *
 * Each field is produced by an independent source and updated on its own;
 * fields are never transactionally consistent with each other.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace beacon::context {

/// @brief User's decision on data collection.
enum class TrackingConsent : std::uint8_t {
  Pending = 0,
  Granted,
  NotGranted
};

/// @brief Identity set by the application for the current user.
struct UserInfo final {
  std::optional<std::string>         id;
  std::optional<std::string>         name;
  std::optional<std::string>         email;
  std::map<std::string, std::string> extra_info;

  bool operator==(const UserInfo&) const = default;
};

/// @brief Last known network reachability.
struct NetworkConnectionInfo final {
  enum class Reachability : std::uint8_t { Yes, Maybe, No };
  enum class Interface : std::uint8_t { Wifi, WiredEthernet, Cellular, Loopback, Other };

  Reachability           reachability{Reachability::Maybe};
  std::vector<Interface> available_interfaces;
  bool                   supports_ipv4{true};
  bool                   supports_ipv6{true};
  bool                   is_expensive{false};
  bool                   is_constrained{false};

  bool operator==(const NetworkConnectionInfo&) const = default;
};

/// @brief Last known cellular carrier.
struct CarrierInfo final {
  std::optional<std::string> carrier_name;
  std::optional<std::string> iso_country_code;
  bool                       allows_voip{false};
  std::string                radio_access_technology;  ///< e.g. "LTE", "NR"

  bool operator==(const CarrierInfo&) const = default;
};

/// @brief Last view reported by the UI tracking layer.
struct ViewEvent final {
  std::string                           view_id;
  std::string                           view_url;
  std::string                           view_name;
  std::chrono::system_clock::time_point date{};
  std::chrono::nanoseconds              time_spent{0};

  bool operator==(const ViewEvent&) const = default;
};

/**
 * @brief Immutable aggregate handed out by SnapshotStore::current().
 *
 * Every field holds the most recent value seen from its source.
 */
struct ContextSnapshot final {
  TrackingConsent                      tracking_consent{TrackingConsent::Pending};
  UserInfo                             user_info;
  std::optional<NetworkConnectionInfo> network_connection_info;
  std::optional<CarrierInfo>           carrier_info;
  std::optional<ViewEvent>             last_view_event;

  bool operator==(const ContextSnapshot&) const = default;
};

} // namespace beacon::context
