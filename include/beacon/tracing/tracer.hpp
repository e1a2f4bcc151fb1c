#pragma once
/**
 * @file tracer.hpp
 * @brief Pluggable tracer capability: create, inject and extract span contexts.
 * @details The engine receives a tracer explicitly (no process-wide global).
 *          A NoopTracer stands for "tracing not registered": it reports
 *          enabled() == false and callers skip injection/extraction.
 */

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string_view>

#include "beacon/net/http.hpp"

namespace beacon::tracing {

/** @struct SpanContext
 *  @brief Opaque distributed-tracing identity propagated via HTTP headers.
 */
struct SpanContext {
    std::uint64_t trace_id{0};  ///< Shared by every span of the trace
    std::uint64_t span_id{0};   ///< Client span; the backend sees it as parent

    bool operator==(const SpanContext&) const = default;
};

/** @class HttpHeadersWriter
 *  @brief Collects the propagation header fields a tracer writes.
 */
class HttpHeadersWriter {
public:
    void write(std::string_view field, std::string_view value) { headers_.insert_or_assign(std::string(field), std::string(value)); }
    const net::HeaderMap& trace_propagation_headers() const noexcept { return headers_; }
private:
    net::HeaderMap headers_;
};

/** @class HttpHeadersReader
 *  @brief Read-only view over request header fields for extraction.
 */
class HttpHeadersReader {
public:
    explicit HttpHeadersReader(const net::HeaderMap& headers) noexcept : headers_(&headers) {}
    std::optional<std::string_view> read(std::string_view field) const;
private:
    const net::HeaderMap* headers_;
};

/** @class Tracer
 *  @brief Tracer capability consumed by the interceptor and the tracing handler.
 *  Implementations must be safe to call from any thread.
 */
class Tracer {
public:
    virtual ~Tracer() = default;

    /// False for the no-op tracer; callers then skip all tracing work.
    virtual bool enabled() const noexcept = 0;

    /// New root span context (fresh trace and span IDs).
    virtual SpanContext create_span_context() = 0;

    /// Write @p ctx as propagation header fields.
    virtual void inject(const SpanContext& ctx, HttpHeadersWriter& writer) const = 0;

    /// Span context carried by @p reader, if complete and well-formed.
    virtual std::optional<SpanContext> extract(const HttpHeadersReader& reader) const = 0;
};

/** @class NoopTracer
 *  @brief Stand-in when no tracer is registered.
 */
class NoopTracer final : public Tracer {
public:
    bool enabled() const noexcept override { return false; }
    SpanContext create_span_context() override { return {}; }
    void inject(const SpanContext&, HttpHeadersWriter&) const override {}
    std::optional<SpanContext> extract(const HttpHeadersReader&) const override { return std::nullopt; }
};

/** @class RandomTracer
 *  @brief Tracer issuing random 63-bit IDs, serialized as decimal header values.
 */
class RandomTracer final : public Tracer {
public:
    RandomTracer();
    /// Deterministic IDs for tests and replays.
    explicit RandomTracer(std::uint64_t seed);

    bool enabled() const noexcept override { return true; }
    SpanContext create_span_context() override;
    void inject(const SpanContext& ctx, HttpHeadersWriter& writer) const override;
    std::optional<SpanContext> extract(const HttpHeadersReader& reader) const override;

private:
    std::uint64_t next_id();

    std::mutex          mu_;
    std::mt19937_64     rng_;  ///< Guarded by mu_
};

/// Shared no-op tracer instance.
std::shared_ptr<Tracer> make_noop_tracer();

} // namespace beacon::tracing
