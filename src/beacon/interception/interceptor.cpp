// Interceptor: implementation notes
//   • Internal filtering happens on the caller's thread so SDK traffic never
//     reaches the queue.
//   • Everything that reads or writes `interceptions_` is a queue job.
//   • The tracer pointer is published RCU-style: atomic_store (RELEASE) on
//     update, atomic_load (ACQUIRE) on use; old tracers live until the last
//     in-flight user drops its reference.

#include "beacon/interception/interceptor.hpp"

#include <memory>   // atomic_load/atomic_store for shared_ptr
#include <utility>

#include "beacon/config/constants.hpp"

namespace beacon::interception {

using namespace beacon::config::constants;

namespace {

/// Stands in for a missing handler: tasks are still correlated and evicted.
class NoopHandler final : public InterceptionHandler {
public:
    void notify_interception_started(const TaskInterception&) override {}
    void notify_interception_completed(const TaskInterception&) override {}
};

} // namespace

Interceptor::Interceptor(const config::AutoInstrumentationConfig& cfg,
                         std::shared_ptr<InterceptionHandler> handler,
                         std::shared_ptr<tracing::Tracer> tracer,
                         obs::Observer* observer)
    : default_first_party_hosts_(cfg.first_party_hosts),
      internal_urls_(cfg.sdk_internal_urls),
      inject_tracing_headers_(cfg.instrument_tracing),
      handler_(handler ? std::move(handler) : std::make_shared<NoopHandler>()),
      tracer_(tracer ? std::move(tracer) : tracing::make_noop_tracer()),
      observer_(observer),
      queue_(INTERCEPTOR_QUEUE_LABEL)
{
    // The backend counts RUM-originated traces separately; it needs to be told.
    if (cfg.instrument_tracing && cfg.instrument_rum) {
        additional_headers_.emplace(std::string(ORIGIN_HEADER), std::string(RUM_ORIGIN_VALUE));
    }
}

//------------------------------- Request modification -------------------------

net::HttpRequest Interceptor::modify(const net::HttpRequest& request,
                                     const SessionHostsProvider* session) const {
    if (internal_urls_.is_internal(request.url)) {
        return request;
    }
    const auto session_hosts = session ? session->additional_first_party_hosts() : nullptr;
    if (inject_tracing_headers_ && is_first_party(request.url, session_hosts.get())) {
        return inject_span_context(request);
    }
    return request;
}

//------------------------------- Task lifecycle -------------------------------

void Interceptor::task_created(const SessionTask& task, const SessionHostsProvider* session) {
    const auto& original = task.original_request();
    if (!original) return;  // nothing to classify
    if (internal_urls_.is_internal(original->url)) {
        record(obs::EventKind::SkippedInternal, task.id(), original->url);
        return;
    }

    auto session_hosts = session ? session->additional_first_party_hosts() : nullptr;
    queue_.async([this, id = task.id(), request = *original, session_hosts = std::move(session_hosts)]() mutable {
        const bool first_party = is_first_party(request.url, session_hosts.get());
        auto span = extract_span_context(request);

        auto [it, inserted] = interceptions_.try_emplace(id, id, std::move(request), first_party);
        if (!inserted) return;  // duplicate creation callback; keep the first record

        if (span) it->second.register_span_context(*span);

        record(obs::EventKind::Started, id, it->second.request().url,
               first_party, it->second.span_context().has_value());
        handler_->notify_interception_started(it->second);
    });
}

void Interceptor::task_metrics_collected(const SessionTask& task, ResourceMetrics metrics) {
    const auto& original = task.original_request();
    if (original && internal_urls_.is_internal(original->url)) return;

    queue_.async([this, id = task.id(), metrics = std::move(metrics)]() mutable {
        const auto it = interceptions_.find(id);
        if (it == interceptions_.end()) {
            record(obs::EventKind::OrphanCallback, id, {});
            return;
        }
        it->second.register_metrics(std::move(metrics));
        finish_if_done(id);
    });
}

void Interceptor::task_completed(const SessionTask& task, std::optional<TaskError> error) {
    const auto& original = task.original_request();
    if (original && internal_urls_.is_internal(original->url)) return;

    ResourceCompletion completion{task.response(), std::move(error)};
    queue_.async([this, id = task.id(), completion = std::move(completion)]() mutable {
        const auto it = interceptions_.find(id);
        if (it == interceptions_.end()) {
            record(obs::EventKind::OrphanCallback, id, {});
            return;
        }
        it->second.register_completion(std::move(completion));
        finish_if_done(id);
    });
}

void Interceptor::finish_if_done(TaskId id) {
    auto it = interceptions_.find(id);
    if (it == interceptions_.end() || !it->second.is_done()) return;

    // Evict before notifying: a late duplicate callback must find nothing.
    auto node = interceptions_.extract(it);
    const TaskInterception& done = node.mapped();
    record(obs::EventKind::Completed, id, done.request().url,
           done.is_first_party(), done.span_context().has_value());
    handler_->notify_interception_completed(done);
}

//------------------------------- Tracer registration --------------------------

void Interceptor::update_tracer(std::shared_ptr<tracing::Tracer> tracer) noexcept {
    if (!tracer) tracer = tracing::make_noop_tracer();
    std::atomic_store_explicit(&tracer_, std::move(tracer), std::memory_order_release);
}

std::shared_ptr<tracing::Tracer> Interceptor::tracer() const noexcept {
    return std::atomic_load_explicit(&tracer_, std::memory_order_acquire);
}

//------------------------------- Helpers --------------------------------------

bool Interceptor::is_first_party(const std::string& url, const net::FirstPartyHosts* session_hosts) const {
    return net::classify(url, internal_urls_, default_first_party_hosts_, session_hosts)
           == net::Classification::FirstParty;
}

net::HttpRequest Interceptor::inject_span_context(const net::HttpRequest& first_party_request) const {
    const auto t = tracer();
    if (!t->enabled()) return first_party_request;

    tracing::HttpHeadersWriter writer;
    const auto ctx = t->create_span_context();
    t->inject(ctx, writer);

    net::HttpRequest out = first_party_request;
    for (const auto& [field, value] : writer.trace_propagation_headers()) out.set_header(field, value);
    for (const auto& [field, value] : additional_headers_)                out.set_header(field, value);

    record(obs::EventKind::Injected, 0, out.url, true, true);
    return out;
}

std::optional<tracing::SpanContext> Interceptor::extract_span_context(const net::HttpRequest& request) const {
    const auto t = tracer();
    if (!t->enabled() || request.headers.empty()) return std::nullopt;
    return t->extract(tracing::HttpHeadersReader(request.headers));
}

void Interceptor::record(obs::EventKind kind, TaskId id, const std::string& url,
                         bool first_party, bool has_span) const {
    if (!observer_) return;
    observer_->record(obs::InterceptionEvent{kind, id, url, first_party, has_span});
}

} // namespace beacon::interception
