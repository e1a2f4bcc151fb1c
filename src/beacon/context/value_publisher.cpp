/**
 * @file value_publisher.cpp
 * @brief Explicit template instantiations for ValuePublisher to reduce code bloat.
*/

#include "beacon/context/value_publisher.hpp"
#include "beacon/context/context_snapshot.hpp"

#include <optional>

namespace beacon::context {

    /// Explicit instantiations of ValuePublisher for the context sources.
    /// This ensures one compiled instance instead of every TU instantiating its own.

    template class ValuePublisher<TrackingConsent>;
    template class ValuePublisher<UserInfo>;
    template class ValuePublisher<std::optional<NetworkConnectionInfo>>;
    template class ValuePublisher<std::optional<CarrierInfo>>;
    template class ValuePublisher<std::optional<ViewEvent>>;
} // namespace beacon::context
