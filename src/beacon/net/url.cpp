/**
 * @file url.cpp
 * @brief Hand-rolled authority parser; enough for host/origin classification.
 */
#include "beacon/net/url.hpp"

#include <algorithm>
#include <cctype>

namespace beacon::net {

namespace {

std::string to_lower_ascii(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool valid_scheme(std::string_view s) noexcept {
    if (s.empty() || !std::isalpha(static_cast<unsigned char>(s.front()))) return false;
    return std::all_of(s.begin(), s.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.';
    });
}

} // namespace

std::optional<std::uint16_t> Url::effective_port() const noexcept {
    if (port) return port;
    if (scheme == "https") return std::uint16_t{443};
    if (scheme == "http")  return std::uint16_t{80};
    return std::nullopt;
}

beacon_detail::expected<Url, UrlError> parse_url(std::string_view text) {
    if (text.empty()) return beacon_detail::unexpected(UrlError::Empty);

    const auto sep = text.find("://");
    if (sep == std::string_view::npos || !valid_scheme(text.substr(0, sep))) {
        return beacon_detail::unexpected(UrlError::MissingScheme);
    }

    Url url;
    url.scheme = to_lower_ascii(text.substr(0, sep));
    std::string_view rest = text.substr(sep + 3);

    // Fragment is never sent; drop it before splitting the rest.
    if (const auto hash = rest.find('#'); hash != std::string_view::npos) rest = rest.substr(0, hash);

    const auto auth_end = rest.find_first_of("/?");
    std::string_view authority = rest.substr(0, auth_end);
    std::string_view tail = (auth_end == std::string_view::npos) ? std::string_view{} : rest.substr(auth_end);

    if (const auto at = authority.rfind('@'); at != std::string_view::npos) authority.remove_prefix(at + 1);

    std::string_view host = authority;
    std::string_view port;
    if (!authority.empty() && authority.front() == '[') {
        const auto close = authority.find(']');
        if (close == std::string_view::npos) return beacon_detail::unexpected(UrlError::MissingHost);
        host = authority.substr(0, close + 1);
        const auto after = authority.substr(close + 1);
        if (!after.empty()) {
            if (after.front() != ':') return beacon_detail::unexpected(UrlError::InvalidPort);
            port = after.substr(1);
        }
    } else if (const auto colon = authority.rfind(':'); colon != std::string_view::npos) {
        host = authority.substr(0, colon);
        port = authority.substr(colon + 1);
    }

    if (host.empty() || host == "[]") return beacon_detail::unexpected(UrlError::MissingHost);
    url.host = to_lower_ascii(host);

    if (!port.empty()) {
        if (port.size() > 5 || !std::all_of(port.begin(), port.end(),
                                            [](char c) { return c >= '0' && c <= '9'; })) {
            return beacon_detail::unexpected(UrlError::InvalidPort);
        }
        unsigned long value = 0;
        for (char c : port) value = value * 10 + static_cast<unsigned long>(c - '0');
        if (value > 65535) return beacon_detail::unexpected(UrlError::InvalidPort);
        url.port = static_cast<std::uint16_t>(value);
    }

    const auto q = tail.find('?');
    url.path = std::string(tail.substr(0, q));
    if (q != std::string_view::npos) url.query = std::string(tail.substr(q + 1));
    return url;
}

} // namespace beacon::net
