#pragma once
/**
 * @file session.hpp
 * @brief Per-session extension of first party classification.
 * @details A transport wrapper implements SessionHostsProvider to widen the
 *          engine's default first party hosts for requests sent through it.
 *          The two sources are OR-ed.
 */

#include <memory>
#include <set>
#include <string>

#include "beacon/net/url_filters.hpp"

namespace beacon::interception {

    class SessionHostsProvider {
    public:
        virtual ~SessionHostsProvider() = default;

        /// Hosts treated as first party for this session only; nullptr when none.
        /// Returned by shared_ptr so queued work may outlive the session object.
        virtual std::shared_ptr<const net::FirstPartyHosts> additional_first_party_hosts() const = 0;
    };

    /** @class InstrumentedSession
     *  @brief Session wrapper carrying a fixed set of additional first party hosts.
     */
    class InstrumentedSession final : public SessionHostsProvider {
    public:
        InstrumentedSession() = default;
        explicit InstrumentedSession(const std::set<std::string>& additional_first_party_hosts)
            : hosts_(std::make_shared<const net::FirstPartyHosts>(additional_first_party_hosts)) {}

        std::shared_ptr<const net::FirstPartyHosts> additional_first_party_hosts() const override {
            return hosts_;
        }

    private:
        std::shared_ptr<const net::FirstPartyHosts> hosts_;
    };

} // namespace beacon::interception
