/**
 * @file tracer.cpp
 * @brief Header propagation for RandomTracer and the shared no-op tracer.
 */
#include "beacon/tracing/tracer.hpp"
#include "beacon/config/constants.hpp"

#include <charconv>
#include <string>

namespace beacon::tracing {

using namespace beacon::config::constants;

namespace {

/// Decimal u64, whole string, non-zero.
std::optional<std::uint64_t> parse_id(std::string_view s) noexcept {
    std::uint64_t v = 0;
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc{} || ptr != s.data() + s.size() || v == 0) return std::nullopt;
    return v;
}

} // namespace

std::optional<std::string_view> HttpHeadersReader::read(std::string_view field) const {
    const auto it = headers_->find(field);
    if (it == headers_->end()) return std::nullopt;
    return std::string_view(it->second);
}

RandomTracer::RandomTracer() : rng_(std::random_device{}()) {}

RandomTracer::RandomTracer(std::uint64_t seed) : rng_(seed) {}

std::uint64_t RandomTracer::next_id() {
    // 63 bits, never zero: zero means "absent" on the wire.
    constexpr std::uint64_t MASK = 0x7FFFFFFFFFFFFFFFULL;
    std::lock_guard<std::mutex> lk(mu_);
    std::uint64_t id = 0;
    while (id == 0) id = rng_() & MASK;
    return id;
}

SpanContext RandomTracer::create_span_context() {
    SpanContext ctx;
    ctx.trace_id = next_id();
    ctx.span_id  = next_id();
    return ctx;
}

void RandomTracer::inject(const SpanContext& ctx, HttpHeadersWriter& writer) const {
    writer.write(TRACE_ID_HEADER,       std::to_string(ctx.trace_id));
    writer.write(PARENT_SPAN_ID_HEADER, std::to_string(ctx.span_id));
}

std::optional<SpanContext> RandomTracer::extract(const HttpHeadersReader& reader) const {
    const auto trace = reader.read(TRACE_ID_HEADER);
    const auto span  = reader.read(PARENT_SPAN_ID_HEADER);
    if (!trace || !span) return std::nullopt;
    const auto trace_id = parse_id(*trace);
    const auto span_id  = parse_id(*span);
    if (!trace_id || !span_id) return std::nullopt;
    return SpanContext{*trace_id, *span_id};
}

std::shared_ptr<Tracer> make_noop_tracer() {
    static const auto noop = std::make_shared<NoopTracer>(); // process-wide singleton
    return noop;
}

} // namespace beacon::tracing
