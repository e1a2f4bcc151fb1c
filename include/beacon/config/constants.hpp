#pragma once
/**
 * @file constants.hpp
 * @brief Centralized named constants for the interception core.
 * @details Header field names are part of the wire contract with the backend
 *          and must not change. Everything else is a default that the Config
 *          Loader may override.
 */

#include <cstddef>
#include <string_view>

namespace beacon::config::constants {

// =====================
// Trace propagation headers (sent lower-case; matched case-insensitively)
// =====================
/// Trace ID of the span context, unsigned 64-bit decimal.
inline constexpr std::string_view TRACE_ID_HEADER        = "x-datadog-trace-id";
/// Span ID of the client span, sent as the backend's parent, unsigned 64-bit decimal.
inline constexpr std::string_view PARENT_SPAN_ID_HEADER  = "x-datadog-parent-id";
/// Origin marker, added only when tracing and resource tracking both run.
inline constexpr std::string_view ORIGIN_HEADER          = "x-datadog-origin";
/// Value of ORIGIN_HEADER identifying the resource-tracking subsystem.
inline constexpr std::string_view RUM_ORIGIN_VALUE       = "rum";

// =====================
// Span emitted by the tracing handler
// =====================
inline constexpr std::string_view SPAN_OPERATION_NAME    = "urlsession.request";
inline constexpr std::string_view SPAN_KIND_CLIENT       = "client";

// =====================
// Serialization points (labels show up in thread names and stderr reports)
// =====================
inline constexpr std::string_view INTERCEPTOR_QUEUE_LABEL = "beacon.interceptor";
inline constexpr std::string_view CONTEXT_QUEUE_LABEL     = "beacon.context";

// =====================
// Loader defaults
// =====================
/// Intake endpoint used when the configuration names none.
inline constexpr std::string_view DEFAULT_INTAKE_URL     = "https://browser-intake-datadoghq.com";
inline constexpr bool   DEFAULT_INSTRUMENT_TRACING       = true;
inline constexpr bool   DEFAULT_INSTRUMENT_RUM           = false;
/// Longest config line accepted by the loader (guards against binary input).
inline constexpr std::size_t CONFIG_MAX_LINE_LEN         = 4096;

} // namespace beacon::config::constants
