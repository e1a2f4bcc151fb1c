#pragma once
/**
 * @file url_filters.hpp
 * @brief Request classification: SDK-internal vs first party vs third party.
 * @details Both filters are immutable after construction and safe to share
 *          between threads. Neither throws: unparseable or host-less URLs are
 *          neither internal nor first party.
 */

#include <cstdint>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "beacon/net/url.hpp"

namespace beacon::net {

/** @enum Classification
 *  @brief Where a request goes, from the SDK's point of view.
 */
enum class Classification : std::uint8_t {
    Internal,    ///< SDK intake endpoint: never tracked, never modified
    FirstParty,  ///< App-owned backend: trace-injected and correlated
    ThirdParty   ///< Anything else: correlated only
};

/** @class FirstPartyHosts
 *  @brief Matches a URL whose host equals, or is a subdomain of, a configured host.
 */
class FirstPartyHosts {
public:
    FirstPartyHosts() = default;
    /// Hosts are lower-cased; empty entries are dropped.
    explicit FirstPartyHosts(const std::set<std::string>& hosts);

    [[nodiscard]] bool is_first_party(std::string_view url) const;
    [[nodiscard]] bool is_first_party(const Url& url) const noexcept;

    [[nodiscard]] bool empty() const noexcept { return hosts_.empty(); }
    [[nodiscard]] const std::set<std::string>& hosts() const noexcept { return hosts_; }

private:
    std::set<std::string> hosts_;
};

/** @class InternalUrls
 *  @brief Matches URLs on one of the SDK's own endpoints (same origin, path prefix).
 */
class InternalUrls {
public:
    InternalUrls() = default;
    /// Endpoints that fail to parse are dropped (they could never match).
    explicit InternalUrls(const std::set<std::string>& endpoints);

    [[nodiscard]] bool is_internal(std::string_view url) const;

    [[nodiscard]] std::size_t size() const noexcept { return endpoints_.size(); }

private:
    std::vector<Url> endpoints_;
};

/**
 * @brief Full classification with precedence Internal > FirstParty > ThirdParty.
 * @param session_hosts Optional per-session hosts, OR-ed with @p defaults.
 */
Classification classify(std::string_view url,
                        const InternalUrls& internal,
                        const FirstPartyHosts& defaults,
                        const FirstPartyHosts* session_hosts = nullptr);

} // namespace beacon::net
