#pragma once
/**
 * @file resource_handler.hpp
 * @brief Handler emitting RUM resource events (start, then stop or error).
 */

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "beacon/interception/handler.hpp"
#include "beacon/tracing/tracer.hpp"

namespace beacon::interception {

    /** @enum ResourceKind
     *  @brief Resource category shown in RUM. Method first, then response MIME type.
     */
    enum class ResourceKind : std::uint8_t { Xhr, Image, Media, Font, Css, Js, Native };

    const char* to_string(ResourceKind k) noexcept;

    /// Xhr for POST/PUT/DELETE; otherwise derived from @p mime_type (Native when unknown).
    ResourceKind resource_kind(const std::string& method, const std::string& mime_type);

    /** @struct ResourceEvent
     *  @brief One step of a resource's life as seen by the RUM pipeline.
     */
    struct ResourceEvent {
        enum class Type : std::uint8_t { Start, Stop, Error };

        Type          type{Type::Start};
        std::string   resource_key;          ///< Same key for every event of one task
        std::chrono::system_clock::time_point date{};
        std::string   url;
        std::string   method;
        ResourceKind  kind{ResourceKind::Native};
        std::optional<int>                  status_code;
        std::optional<std::uint64_t>        size;
        std::optional<ResourceMetrics>      metrics;       ///< Stop/Error only
        std::optional<TaskError>            error;         ///< Error only
        std::optional<tracing::SpanContext> span_context;  ///< Links the resource to its backend trace
    };

    /** @class ResourceOutput
     *  @brief Sink for resource events (the RUM pipeline).
     */
    class ResourceOutput {
    public:
        virtual ~ResourceOutput() = default;
        virtual void write(const ResourceEvent& event) = 0;
    };

    /** @class ResourceHandler
     *  @brief Tracks every non-internal request as a RUM resource.
     */
    class ResourceHandler final : public InterceptionHandler {
    public:
        using Clock = std::function<std::chrono::system_clock::time_point()>;

        explicit ResourceHandler(std::shared_ptr<ResourceOutput> output,
                                 Clock clock = [] { return std::chrono::system_clock::now(); });

        void notify_interception_started(const TaskInterception& interception) override;
        void notify_interception_completed(const TaskInterception& interception) override;

    private:
        std::shared_ptr<ResourceOutput> output_;
        Clock                           clock_;
    };

} // namespace beacon::interception
