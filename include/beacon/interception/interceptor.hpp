#pragma once
// Beacon: Interceptor
// Correlates the asynchronous lifecycle callbacks of network tasks into one
// TaskInterception per task and hands it to an InterceptionHandler.
//
// Concurrency model:
//   • modify() runs on the caller's thread. It touches no shared mutable state
//     (the tracer is read through an atomic shared_ptr snapshot).
//   • task_created / task_metrics_collected / task_completed filter internal
//     requests on the caller's thread, then enqueue their work on a single
//     SerialQueue and return immediately. All reads and writes of the
//     interception map happen on that queue, in FIFO order, so callbacks for
//     the same task are applied in the order they were made.
//   • Handlers run on the queue; they see a record that nothing else mutates.
//
// Failure policy: nothing here throws to the caller or alters a request on an
// internal error. Unparseable URLs are third party; no tracer means no
// injection; callbacks for unknown tasks are ignored.
//
// Known limitation: a task that starts but never delivers both metrics and
// completion keeps its record for the interceptor's lifetime (see in_flight()).

#include <cstddef>
#include <memory>
#include <optional>
#include <unordered_map>

#include "beacon/config/config_loader.hpp"
#include "beacon/exec/serial_queue.hpp"
#include "beacon/interception/handler.hpp"
#include "beacon/interception/session.hpp"
#include "beacon/interception/task.hpp"
#include "beacon/interception/task_interception.hpp"
#include "beacon/net/http.hpp"
#include "beacon/net/url_filters.hpp"
#include "beacon/obs/observability.hpp"
#include "beacon/tracing/tracer.hpp"

namespace beacon::interception {

class Interceptor final {
public:
    /**
     * @param cfg      First party hosts, internal endpoints and instrumentation switches.
     * @param handler  Receives start/completion notifications; nullptr installs a no-op handler.
     * @param tracer   Span context source; the no-op tracer disables injection.
     * @param observer Optional decision log; nullptr keeps the interceptor silent.
     */
    Interceptor(const config::AutoInstrumentationConfig& cfg,
                std::shared_ptr<InterceptionHandler> handler,
                std::shared_ptr<tracing::Tracer> tracer = tracing::make_noop_tracer(),
                obs::Observer* observer = nullptr);

    /// Drains queued callbacks (handlers still get notified), then stops the queue.
    ~Interceptor() = default;

    Interceptor(const Interceptor&)            = delete;
    Interceptor& operator=(const Interceptor&) = delete;

    // --------------------------- Request modification ------------------------
    /**
     * @brief Return @p request with trace propagation headers if it is first party
     *        and tracing is enabled; otherwise return it unchanged.
     * Call exactly once per request actually sent: every call mints a new span context.
     */
    [[nodiscard]] net::HttpRequest modify(const net::HttpRequest& request,
                                          const SessionHostsProvider* session = nullptr) const;

    // --------------------------- Task lifecycle ------------------------------
    /// The task was created. Starts tracking unless its request is internal.
    void task_created(const SessionTask& task, const SessionHostsProvider* session = nullptr);

    /// The transport delivered the task's metrics.
    void task_metrics_collected(const SessionTask& task, ResourceMetrics metrics);

    /// The task finished, successfully or with @p error. The response is read from @p task.
    void task_completed(const SessionTask& task, std::optional<TaskError> error);

    // --------------------------- Tracer registration -------------------------
    /// Replace the tracer; takes effect for subsequent calls. nullptr installs the no-op tracer.
    void update_tracer(std::shared_ptr<tracing::Tracer> tracer) noexcept;
    [[nodiscard]] std::shared_ptr<tracing::Tracer> tracer() const noexcept;

    // --------------------------- Introspection -------------------------------
    [[nodiscard]] bool injects_tracing_headers() const noexcept { return inject_tracing_headers_; }
    /// `x-datadog-origin: rum` when tracing and RUM are both enabled; empty otherwise.
    [[nodiscard]] const net::HeaderMap& additional_first_party_headers() const noexcept { return additional_headers_; }
    [[nodiscard]] InterceptionHandler& handler() const noexcept { return *handler_; }

    /// Block until every callback enqueued before this call has been processed.
    void flush() { queue_.flush(); }

    /// Number of tasks started but not yet completed (synchronous round trip).
    [[nodiscard]] std::size_t in_flight() { return queue_.sync([this] { return interceptions_.size(); }); }

private:
    bool is_first_party(const std::string& url, const net::FirstPartyHosts* session_hosts) const;
    net::HttpRequest inject_span_context(const net::HttpRequest& first_party_request) const;
    std::optional<tracing::SpanContext> extract_span_context(const net::HttpRequest& request) const;

    /// Queue-only: evict and notify when both halves have arrived.
    void finish_if_done(TaskId id);

    void record(obs::EventKind kind, TaskId id, const std::string& url,
                bool first_party = false, bool has_span = false) const;

    net::FirstPartyHosts                 default_first_party_hosts_;
    net::InternalUrls                    internal_urls_;
    bool                                 inject_tracing_headers_{false};
    net::HeaderMap                       additional_headers_;
    std::shared_ptr<InterceptionHandler> handler_;
    std::shared_ptr<tracing::Tracer>     tracer_;   ///< atomic_load / atomic_store only
    obs::Observer*                       observer_{nullptr};

    std::unordered_map<TaskId, TaskInterception> interceptions_;  ///< Queue-only

    // Declared last: destroyed first, so queued jobs drain against live members.
    exec::SerialQueue queue_;
};

} // namespace beacon::interception
