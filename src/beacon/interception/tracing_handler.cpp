/**
 * @file tracing_handler.cpp
 * @brief Span construction for completed first party requests.
 */
#include "beacon/interception/tracing_handler.hpp"
#include "beacon/config/constants.hpp"

#include <utility>

namespace beacon::interception {

using namespace beacon::config::constants;

TracingHandler::TracingHandler(std::shared_ptr<SpanOutput> output, std::shared_ptr<tracing::Tracer> tracer)
    : output_(std::move(output)),
      tracer_(tracer ? std::move(tracer) : tracing::make_noop_tracer()) {}

void TracingHandler::notify_interception_started(const TaskInterception&) {
    // Spans are emitted whole at completion; nothing to do at start.
}

void TracingHandler::notify_interception_completed(const TaskInterception& interception) {
    if (!interception.is_first_party()) return;
    const auto& metrics    = interception.metrics();
    const auto& completion = interception.completion();
    if (!metrics || !completion) return;

    tracing::SpanContext ctx;
    if (interception.span_context()) {
        ctx = *interception.span_context();
    } else if (tracer_->enabled()) {
        ctx = tracer_->create_span_context();
    } else {
        return;  // no propagated context and nobody to mint one
    }

    const auto& request = interception.request();
    SpanRecord span;
    span.trace_id       = ctx.trace_id;
    span.span_id        = ctx.span_id;
    span.operation_name = std::string(SPAN_OPERATION_NAME);
    span.resource       = request.url;
    span.start          = metrics->fetch.start;
    span.duration       = metrics->fetch.duration();
    span.tags["http.url"]    = request.url;
    span.tags["http.method"] = request.method;
    span.tags["span.kind"]   = std::string(SPAN_KIND_CLIENT);

    const int status = completion->response ? completion->response->status_code : 0;
    span.tags["http.status_code"] = std::to_string(status);

    if (completion->error) {
        span.is_error = true;
        span.tags["error.type"] = completion->error->domain + " - " + std::to_string(completion->error->code);
        span.tags["error.msg"]  = completion->error->description;
    } else if (status >= 400 && status < 500) {
        span.is_error = true;
        span.tags["error.type"] = "HTTPError - " + std::to_string(status);
        span.tags["error.msg"]  = "HTTP " + std::to_string(status);
    }
    if (status == 404) span.resource = "404";

    output_->write(span);
}

} // namespace beacon::interception
