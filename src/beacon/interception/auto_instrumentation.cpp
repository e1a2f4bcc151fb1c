/**
 * @file auto_instrumentation.cpp
 * @brief Handler selection for make_interceptor().
 */
#include "beacon/interception/auto_instrumentation.hpp"

#include <utility>

namespace beacon::interception {

beacon_detail::expected<std::unique_ptr<Interceptor>, SetupError>
make_interceptor(const config::AutoInstrumentationConfig& cfg,
                 std::shared_ptr<SpanOutput> span_output,
                 std::shared_ptr<ResourceOutput> resource_output,
                 std::shared_ptr<tracing::Tracer> tracer,
                 obs::Observer* observer) {
    if (!tracer) tracer = tracing::make_noop_tracer();

    std::shared_ptr<InterceptionHandler> handler;
    if (cfg.instrument_rum) {
        if (!resource_output) return beacon_detail::unexpected(SetupError::MissingResourceOutput);
        handler = std::make_shared<ResourceHandler>(std::move(resource_output));
    } else {
        if (!span_output) return beacon_detail::unexpected(SetupError::MissingSpanOutput);
        handler = std::make_shared<TracingHandler>(std::move(span_output), tracer);
    }
    return std::make_unique<Interceptor>(cfg, std::move(handler), std::move(tracer), observer);
}

} // namespace beacon::interception
