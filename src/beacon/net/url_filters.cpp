/**
 * @file url_filters.cpp
 * @brief Host suffix matching and origin/path-prefix matching.
 */
#include "beacon/net/url_filters.hpp"

#include <algorithm>
#include <cctype>

namespace beacon::net {

namespace {

std::string to_lower_ascii(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

/// `host` equals `pattern`, or ends with "." + `pattern`.
bool host_matches(std::string_view host, std::string_view pattern) noexcept {
    if (host.size() == pattern.size()) return host == pattern;
    if (host.size() < pattern.size() + 1) return false;
    const auto boundary = host.size() - pattern.size();
    return host[boundary - 1] == '.' && host.substr(boundary) == pattern;
}

/// Path prefix on segment boundaries: "/v1" matches "/v1" and "/v1/x", not "/v10".
bool path_within(std::string_view path, std::string_view prefix) noexcept {
    while (!prefix.empty() && prefix.back() == '/') prefix.remove_suffix(1);
    if (prefix.empty()) return true;
    if (path.substr(0, prefix.size()) != prefix) return false;
    return path.size() == prefix.size() || path[prefix.size()] == '/';
}

} // namespace

// ------------------------------- FirstPartyHosts -----------------------------

FirstPartyHosts::FirstPartyHosts(const std::set<std::string>& hosts) {
    for (const auto& h : hosts) {
        if (!h.empty()) hosts_.insert(to_lower_ascii(h));
    }
}

bool FirstPartyHosts::is_first_party(std::string_view url) const {
    if (hosts_.empty()) return false;
    const auto parsed = parse_url(url);
    return parsed && is_first_party(*parsed);
}

bool FirstPartyHosts::is_first_party(const Url& url) const noexcept {
    if (url.host.empty()) return false;
    return std::any_of(hosts_.begin(), hosts_.end(),
                       [&](const std::string& h) { return host_matches(url.host, h); });
}

// --------------------------------- InternalUrls ------------------------------

InternalUrls::InternalUrls(const std::set<std::string>& endpoints) {
    for (const auto& e : endpoints) {
        if (auto parsed = parse_url(e)) endpoints_.push_back(std::move(*parsed));
    }
}

bool InternalUrls::is_internal(std::string_view url) const {
    if (endpoints_.empty()) return false;
    const auto parsed = parse_url(url);
    if (!parsed) return false;
    return std::any_of(endpoints_.begin(), endpoints_.end(), [&](const Url& e) {
        return e.scheme == parsed->scheme &&
               e.host == parsed->host &&
               e.effective_port() == parsed->effective_port() &&
               path_within(parsed->path, e.path);
    });
}

// ---------------------------------- classify ---------------------------------

Classification classify(std::string_view url,
                        const InternalUrls& internal,
                        const FirstPartyHosts& defaults,
                        const FirstPartyHosts* session_hosts) {
    if (internal.is_internal(url)) return Classification::Internal;
    const auto parsed = parse_url(url);
    if (!parsed) return Classification::ThirdParty;
    const bool first_party = defaults.is_first_party(*parsed) ||
                             (session_hosts && session_hosts->is_first_party(*parsed));
    return first_party ? Classification::FirstParty : Classification::ThirdParty;
}

} // namespace beacon::net
