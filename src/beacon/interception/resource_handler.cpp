/**
 * @file resource_handler.cpp
 * @brief RUM resource events from interception notifications.
 */
#include "beacon/interception/resource_handler.hpp"

#include <utility>

namespace beacon::interception {

const char* to_string(ResourceKind k) noexcept {
    switch (k) {
        case ResourceKind::Xhr:    return "xhr";
        case ResourceKind::Image:  return "image";
        case ResourceKind::Media:  return "media";
        case ResourceKind::Font:   return "font";
        case ResourceKind::Css:    return "css";
        case ResourceKind::Js:     return "js";
        case ResourceKind::Native: return "native";
    }
    return "native";
}

ResourceKind resource_kind(const std::string& method, const std::string& mime_type) {
    if (method == "POST" || method == "PUT" || method == "DELETE") return ResourceKind::Xhr;

    const auto slash   = mime_type.find('/');
    const auto type    = mime_type.substr(0, slash);
    const auto subtype = slash == std::string::npos ? std::string{} : mime_type.substr(slash + 1);
    if (type == "image")                    return ResourceKind::Image;
    if (type == "video" || type == "audio") return ResourceKind::Media;
    if (type == "font")                     return ResourceKind::Font;
    if (type == "text" && subtype == "css") return ResourceKind::Css;
    if (subtype == "javascript")            return ResourceKind::Js;
    return ResourceKind::Native;
}

ResourceHandler::ResourceHandler(std::shared_ptr<ResourceOutput> output, Clock clock)
    : output_(std::move(output)), clock_(std::move(clock)) {}

void ResourceHandler::notify_interception_started(const TaskInterception& interception) {
    const auto& request = interception.request();
    ResourceEvent e;
    e.type         = ResourceEvent::Type::Start;
    e.resource_key = std::to_string(interception.task_id());
    e.date         = clock_();
    e.url          = request.url;
    e.method       = request.method;
    e.kind         = resource_kind(request.method, {});
    e.span_context = interception.span_context();
    output_->write(e);
}

void ResourceHandler::notify_interception_completed(const TaskInterception& interception) {
    const auto& request    = interception.request();
    const auto& completion = interception.completion();
    if (!completion) return;

    ResourceEvent e;
    e.resource_key = std::to_string(interception.task_id());
    e.date         = clock_();
    e.url          = request.url;
    e.method       = request.method;
    e.metrics      = interception.metrics();
    e.span_context = interception.span_context();
    if (completion->response) {
        e.status_code = completion->response->status_code;
        e.kind        = resource_kind(request.method, completion->response->mime_type);
    } else {
        e.kind        = resource_kind(request.method, {});
    }
    if (interception.metrics()) e.size = interception.metrics()->response_size;

    if (completion->error) {
        e.type  = ResourceEvent::Type::Error;
        e.error = completion->error;
    } else {
        e.type  = ResourceEvent::Type::Stop;
    }
    output_->write(e);
}

} // namespace beacon::interception
