#pragma once
/**
 * @file observability.hpp
 * @brief Minimal observability facade: interception events + counters.
 * @details Replace the backing implementation with spdlog/OpenTelemetry later.
 */

#include <string>
#include <cstdint>

namespace beacon::obs {

    /** @enum EventKind
     *  @brief Decisions taken by the interception engine.
     */
    enum class EventKind : std::uint8_t {
        Started,          ///< Task tracked, handler notified of the start
        Completed,        ///< Metrics and completion both received, record evicted
        SkippedInternal,  ///< Request targets an SDK endpoint; ignored
        OrphanCallback,   ///< Metrics/completion for a task that is not tracked
        Injected          ///< Trace propagation headers written into a request
    };

    /// Stable lower-case label for an event kind.
    const char* to_string(EventKind k) noexcept;

    /** @struct Counters
     *  @brief Process-level counters for interception decisions.
     */
    struct Counters {
        uint64_t started{0};           ///< Interceptions started
        uint64_t completed{0};         ///< Interceptions completed
        uint64_t skipped_internal{0};  ///< SDK-internal requests ignored
        uint64_t orphan_callbacks{0};  ///< Callbacks for untracked tasks
        uint64_t injected{0};          ///< Requests that received trace headers
    };

    /** @struct InterceptionEvent
     *  @brief Payload describing a single engine decision.
     */
    struct InterceptionEvent {
        EventKind   kind{EventKind::Started}; ///< What happened
        uint64_t    task_id{0};               ///< Correlation token (0 for `modify`)
        std::string url;                      ///< Request URL
        bool        first_party{false};       ///< Classification at the time of the event
        bool        has_span_context{false};  ///< Whether trace context is attached
    };

    /** @class Observer
     *  @brief Observability sink interface.
     */
    class Observer {
    public:
        virtual ~Observer() = default;
        /// Record a single interception event.
        virtual void record(const InterceptionEvent& e) = 0;
        /// Return a snapshot of counters.
        virtual Counters snapshot() const = 0;
    };

    /// One JSON object (no trailing newline) describing @p e; the URL is escaped.
    std::string to_json_line(const InterceptionEvent& e);

    // Optional factory declaration (implemented in .cpp)
    Observer* make_simple_observer();

} // namespace beacon::obs
