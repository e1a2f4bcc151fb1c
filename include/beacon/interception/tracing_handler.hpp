#pragma once
/**
 * @file tracing_handler.hpp
 * @brief Handler emitting one client span per completed first party interception.
 */

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <string>

#include "beacon/interception/handler.hpp"
#include "beacon/tracing/tracer.hpp"

namespace beacon::interception {

    /** @struct SpanRecord
     *  @brief Finished span, ready for serialization by the span pipeline.
     */
    struct SpanRecord {
        std::uint64_t trace_id{0};
        std::uint64_t span_id{0};
        std::string   operation_name;                       ///< "urlsession.request"
        std::string   resource;                             ///< URL, or "404" for not-found responses
        std::chrono::system_clock::time_point start{};      ///< Fetch start
        std::chrono::nanoseconds duration{0};               ///< Fetch duration
        bool          is_error{false};
        std::map<std::string, std::string> tags;            ///< http.url, http.method, http.status_code, span.kind, error.*
    };

    /** @class SpanOutput
     *  @brief Sink for finished spans (the tracing pipeline).
     */
    class SpanOutput {
    public:
        virtual ~SpanOutput() = default;
        virtual void write(const SpanRecord& span) = 0;
    };

    /** @class TracingHandler
     *  @brief Turns completed first party interceptions into client spans.
     *  Third party interceptions are ignored. The span reuses the context
     *  propagated in the request headers; without one a new context comes
     *  from the tracer, and with a disabled tracer nothing is emitted.
     */
    class TracingHandler final : public InterceptionHandler {
    public:
        TracingHandler(std::shared_ptr<SpanOutput> output, std::shared_ptr<tracing::Tracer> tracer);

        void notify_interception_started(const TaskInterception& interception) override;
        void notify_interception_completed(const TaskInterception& interception) override;

    private:
        std::shared_ptr<SpanOutput>      output_;
        std::shared_ptr<tracing::Tracer> tracer_;
    };

} // namespace beacon::interception
