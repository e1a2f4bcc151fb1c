#pragma once
/**
 * @file url.hpp
 * @brief Minimal absolute-URL parser used for request classification.
 * @details Accepts `scheme://[userinfo@]host[:port][/path][?query][#fragment]`.
 *          Scheme and host are lower-cased. No percent-decoding, no IDNA.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "beacon/compat/expected.hpp"

namespace beacon::net {

/// Reasons a string was not accepted as an absolute URL.
enum class UrlError : std::uint8_t {
    Empty = 1,      ///< Input is empty
    MissingScheme,  ///< No `scheme://` prefix
    MissingHost,    ///< Authority has no host
    InvalidPort     ///< Port is not a number in [0, 65535]
};

/** @struct Url
 *  @brief Components of a parsed absolute URL.
 */
struct Url {
    std::string scheme;                ///< Lower-case, e.g. "https"
    std::string host;                  ///< Lower-case; IPv6 literals keep their brackets
    std::optional<std::uint16_t> port; ///< Explicit port only
    std::string path;                  ///< Starts with '/' or is empty
    std::string query;                 ///< Without the leading '?'

    /// Explicit port, else the scheme default (80/443), else nullopt.
    std::optional<std::uint16_t> effective_port() const noexcept;

    bool operator==(const Url&) const = default;
};

/**
 * @brief Parse an absolute URL.
 * @return The components, or why the input was rejected. Never throws on bad input.
 */
beacon_detail::expected<Url, UrlError> parse_url(std::string_view text);

} // namespace beacon::net
