/**
* @file config_loader.cpp
 * @brief Line-oriented `key = value` loader over named defaults.
 */
#include "beacon/config/config_loader.hpp"
#include "beacon/config/constants.hpp"

#include <fstream>
#include <sstream>

namespace beacon::config {
    using namespace beacon::config::constants;

    namespace {

    std::string_view trim(std::string_view s) noexcept {
        const auto is_space = [](char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; };
        while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
        while (!s.empty() && is_space(s.back()))  s.remove_suffix(1);
        return s;
    }

    std::set<std::string> split_list(std::string_view value) {
        std::set<std::string> out;
        while (!value.empty()) {
            const auto comma = value.find(',');
            const auto item  = trim(value.substr(0, comma));
            if (!item.empty()) out.emplace(item);
            if (comma == std::string_view::npos) break;
            value.remove_prefix(comma + 1);
        }
        return out;
    }

    beacon_detail::expected<bool, ConfigError> parse_bool(std::string_view value) {
        if (value == "true")  return true;
        if (value == "false") return false;
        return beacon_detail::unexpected(ConfigError::InvalidBool);
    }

    } // namespace

    const char* to_string(ConfigError e) noexcept {
        switch (e) {
            case ConfigError::Io:            return "io";
            case ConfigError::MalformedLine: return "malformed_line";
            case ConfigError::UnknownKey:    return "unknown_key";
            case ConfigError::InvalidBool:   return "invalid_bool";
            case ConfigError::LineTooLong:   return "line_too_long";
        }
        return "unknown";
    }

    AutoInstrumentationConfig Loader::defaults() {
        AutoInstrumentationConfig cfg;
        cfg.sdk_internal_urls  = {std::string(DEFAULT_INTAKE_URL)};
        cfg.instrument_tracing = DEFAULT_INSTRUMENT_TRACING;
        cfg.instrument_rum     = DEFAULT_INSTRUMENT_RUM;
        return cfg;
    }

    beacon_detail::expected<AutoInstrumentationConfig, ConfigError>
    Loader::parse(std::string_view text) {
        AutoInstrumentationConfig cfg = defaults();

        while (!text.empty()) {
            const auto eol = text.find('\n');
            std::string_view line = text.substr(0, eol);
            text.remove_prefix(eol == std::string_view::npos ? text.size() : eol + 1);

            if (line.size() > CONFIG_MAX_LINE_LEN) return beacon_detail::unexpected(ConfigError::LineTooLong);
            if (const auto hash = line.find('#'); hash != std::string_view::npos) line = line.substr(0, hash);
            line = trim(line);
            if (line.empty()) continue;

            const auto eq = line.find('=');
            if (eq == std::string_view::npos) return beacon_detail::unexpected(ConfigError::MalformedLine);
            const auto key   = trim(line.substr(0, eq));
            const auto value = trim(line.substr(eq + 1));
            if (key.empty()) return beacon_detail::unexpected(ConfigError::MalformedLine);

            if (key == "first_party_hosts") {
                cfg.first_party_hosts = split_list(value);
            } else if (key == "sdk_internal_urls") {
                cfg.sdk_internal_urls = split_list(value);
            } else if (key == "instrument_tracing" || key == "instrument_rum") {
                auto b = parse_bool(value);
                if (!b) return beacon_detail::unexpected(b.error());
                (key == "instrument_tracing" ? cfg.instrument_tracing : cfg.instrument_rum) = *b;
            } else {
                return beacon_detail::unexpected(ConfigError::UnknownKey);
            }
        }
        return cfg;
    }

    beacon_detail::expected<AutoInstrumentationConfig, ConfigError>
    Loader::load_from_file(const std::string& path) {
        std::ifstream in(path);
        if (!in) return beacon_detail::unexpected(ConfigError::Io);
        std::ostringstream buf;
        buf << in.rdbuf();
        if (in.bad()) return beacon_detail::unexpected(ConfigError::Io);
        return parse(buf.str());
    }

} // namespace beacon::config
