#pragma once
/**
 * @file config_loader.hpp
 * @brief Loader facade: named defaults, or a `key = value` file.
 * @details All defaults reference named constants to avoid magic strings.
 */

#include <cstdint>
#include <set>
#include <string>
#include <string_view>

#include "beacon/compat/expected.hpp"

namespace beacon::config {

    /** @struct AutoInstrumentationConfig
     *  @brief Immutable inputs of the interception engine.
     */
    struct AutoInstrumentationConfig {
        std::set<std::string> first_party_hosts;   ///< Hosts (and their subdomains) owned by the app
        std::set<std::string> sdk_internal_urls;   ///< SDK intake endpoints, never intercepted
        bool instrument_tracing{false};            ///< Inject trace headers into 1st party requests
        bool instrument_rum{false};                ///< Track requests as RUM resources

        bool operator==(const AutoInstrumentationConfig&) const = default;
    };

    /** @enum ConfigError
     *  @brief Reasons a configuration source was rejected.
     */
    enum class ConfigError : std::uint8_t {
        Io = 1,          ///< File missing or unreadable
        MalformedLine,   ///< Line is not `key = value`
        UnknownKey,      ///< Key not recognised
        InvalidBool,     ///< Boolean value other than true/false
        LineTooLong      ///< Line exceeds CONFIG_MAX_LINE_LEN
    };

    /// Human-readable label for logs.
    const char* to_string(ConfigError e) noexcept;

    /** @class Loader
     *  @brief Source of interception configuration (defaults or parsed files).
     */
    class Loader {
    public:
        /// Tracing on, RUM off, no first party hosts, default intake endpoint.
        static AutoInstrumentationConfig defaults();

        /**
         * @brief Parse configuration text on top of defaults().
         * @param text File contents; `#` starts a comment, blank lines are skipped.
         * @return Parsed configuration or the first error encountered.
         */
        static beacon_detail::expected<AutoInstrumentationConfig, ConfigError>
        parse(std::string_view text);

        /**
         * @brief Read and parse a configuration file.
         * @param path Path to a `key = value` file.
         */
        static beacon_detail::expected<AutoInstrumentationConfig, ConfigError>
        load_from_file(const std::string& path);
    };

} // namespace beacon::config
