#pragma once
/**
 * @file auto_instrumentation.hpp
 * @brief Factory wiring an Interceptor with the handler the configuration asks for.
 * @details RUM enabled → ResourceHandler (tracing headers still injected when
 *          tracing is on). RUM disabled → TracingHandler.
 */

#include <cstdint>
#include <memory>

#include "beacon/compat/expected.hpp"
#include "beacon/config/config_loader.hpp"
#include "beacon/interception/interceptor.hpp"
#include "beacon/interception/resource_handler.hpp"
#include "beacon/interception/tracing_handler.hpp"
#include "beacon/obs/observability.hpp"
#include "beacon/tracing/tracer.hpp"

namespace beacon::interception {

    /// Setup-time errors; never produced once the interceptor runs.
    enum class SetupError : std::uint8_t {
        MissingResourceOutput = 1,  ///< RUM enabled but no resource sink given
        MissingSpanOutput           ///< Tracing handler selected but no span sink given
    };

    /**
     * @brief Build an interceptor and its handler from @p cfg.
     * @param span_output     Required when RUM is disabled.
     * @param resource_output Required when RUM is enabled.
     */
    beacon_detail::expected<std::unique_ptr<Interceptor>, SetupError>
    make_interceptor(const config::AutoInstrumentationConfig& cfg,
                     std::shared_ptr<SpanOutput> span_output,
                     std::shared_ptr<ResourceOutput> resource_output,
                     std::shared_ptr<tracing::Tracer> tracer,
                     obs::Observer* observer = nullptr);

} // namespace beacon::interception
