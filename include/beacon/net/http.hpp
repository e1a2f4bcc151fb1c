/**
 * @file http.hpp
 * @brief Value types for requests and responses observed by the interceptor.
 *
 * Keep these types simple and copyable. Equality is defaulted so tests can
 * assert that an untouched request is byte-for-byte unchanged.
 */
#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace beacon::net {

/// ASCII case-insensitive ordering for header field names.
struct HeaderNameLess {
  using is_transparent = void;

  bool operator()(std::string_view a, std::string_view b) const noexcept {
    return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end(),
                                        [](unsigned char x, unsigned char y) {
                                          return std::tolower(x) < std::tolower(y);
                                        });
  }
};

/// Header fields by name, matched case-insensitively. A field set under one
/// spelling replaces the value of any other spelling and keeps the first one.
using HeaderMap = std::map<std::string, std::string, HeaderNameLess>;

/// @brief Outgoing HTTP request as seen before (and after) interception.
struct HttpRequest final {
  std::string method{"GET"};
  std::string url;           ///< Absolute URL as given by the caller; may be unparseable
  HeaderMap   headers;
  std::string body;

  /// Set (or replace) a header field, whatever the case of an existing name.
  void set_header(std::string_view name, std::string_view value) {
    headers.insert_or_assign(std::string(name), std::string(value));
  }

  /// Header value, if present (name matched case-insensitively).
  std::optional<std::string> header(std::string_view name) const {
    const auto it = headers.find(name);
    if (it == headers.end()) return std::nullopt;
    return it->second;
  }

  bool operator==(const HttpRequest&) const = default;
};

/// @brief Final response of a task.
struct HttpResponse final {
  int         status_code{0};
  HeaderMap   headers;
  std::string mime_type;

  bool operator==(const HttpResponse&) const = default;
};

} // namespace beacon::net
