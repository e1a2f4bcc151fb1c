/**
 * @file main.cpp
 * @brief interceptor_demo: drive the interception core through the request
 *        scenarios: first party, session-only first party, third party and SDK-internal.
 *
 * **Bootstrap**
 * - Load config (argv[1], or named defaults); pick tracer and handler.
 *
 * **Scenarios**
 * - GET to a first party host (trace headers injected, span or resource emitted).
 * - POST to a first party host registered only on the session.
 * - POST to a third party host (tracked, never injected).
 * - Request to the SDK intake (invisible to the core).
 * - A context snapshot taken after consent/user/view updates.
 *
 * Usage:
 *   ./interceptor_demo [config.conf]
 */

#include <chrono>
#include <cstdio>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "beacon/config/config_loader.hpp"
#include "beacon/context/snapshot_store.hpp"
#include "beacon/interception/auto_instrumentation.hpp"
#include "beacon/obs/observability.hpp"
#include "beacon/version.hpp"

using namespace beacon;

namespace {

class PrintingSpanOutput final : public interception::SpanOutput {
public:
  void write(const interception::SpanRecord& s) override {
    std::cout << "span  trace=" << s.trace_id << " span=" << s.span_id
              << " resource=" << s.resource
              << " status=" << s.tags.at("http.status_code")
              << (s.is_error ? " error" : "") << '\n';
  }
};

class PrintingResourceOutput final : public interception::ResourceOutput {
public:
  void write(const interception::ResourceEvent& e) override {
    static constexpr const char* kTypes[] = {"start", "stop", "error"};
    std::cout << "rum   " << kTypes[static_cast<int>(e.type)]
              << " key=" << e.resource_key << ' ' << e.method << ' ' << e.url
              << " kind=" << interception::to_string(e.kind);
    if (e.status_code) std::cout << " status=" << *e.status_code;
    if (e.span_context) std::cout << " trace=" << e.span_context->trace_id;
    std::cout << '\n';
  }
};

/// Simulates the transport: create, send, then deliver metrics and completion
/// from two different threads in a random-ish order.
void run_task(interception::Interceptor& interceptor,
              const net::HttpRequest& request,
              const interception::SessionHostsProvider* session,
              int status,
              bool metrics_first) {
  const auto sent = interceptor.modify(request, session);
  auto task = std::make_shared<interception::SessionTask>(sent);
  interceptor.task_created(*task, session);

  const auto start = std::chrono::system_clock::now();
  interception::ResourceMetrics metrics;
  metrics.fetch = {start, start + std::chrono::milliseconds(42)};
  metrics.response_size = 1024;

  task->set_response(net::HttpResponse{status, {}, "application/json"});

  std::thread a([&] {
    if (metrics_first) interceptor.task_metrics_collected(*task, metrics);
    else               interceptor.task_completed(*task, std::nullopt);
  });
  std::thread b([&] {
    if (metrics_first) interceptor.task_completed(*task, std::nullopt);
    else               interceptor.task_metrics_collected(*task, metrics);
  });
  a.join();
  b.join();
}

} // namespace

int main(int argc, char** argv) {
  std::cout << "beacon interceptor_demo " << version_string << '\n'
            << "--------------------------------------------------\n";

  auto cfg = config::Loader::defaults();
  if (argc > 1) {
    auto loaded = config::Loader::load_from_file(argv[1]);
    if (!loaded) {
      std::fprintf(stderr, "config %s rejected: %s\n", argv[1], config::to_string(loaded.error()));
      return 1;
    }
    cfg = std::move(*loaded);
  } else {
    cfg.first_party_hosts  = {"api.example.com"};
    cfg.instrument_tracing = true;
    cfg.instrument_rum     = true;
  }

  auto made = interception::make_interceptor(cfg,
                                             std::make_shared<PrintingSpanOutput>(),
                                             std::make_shared<PrintingResourceOutput>(),
                                             std::make_shared<tracing::RandomTracer>(),
                                             obs::make_simple_observer());
  if (!made) {
    std::fprintf(stderr, "interceptor setup failed (%d)\n", static_cast<int>(made.error()));
    return 1;
  }
  auto& interceptor = **made;
  interception::InstrumentedSession session({"cdn.example.net"});

  net::HttpRequest get{"GET", "https://api.example.com/v1/items?page=2", {}, {}};
  net::HttpRequest post{"POST", "https://cdn.example.net/upload", {{"content-type", "application/json"}}, "{}"};
  net::HttpRequest third{"POST", "https://www.thirdparty.io/about", {}, {}};
  const std::string intake = cfg.sdk_internal_urls.empty() ? std::string("https://intake.invalid")
                                                           : *cfg.sdk_internal_urls.begin();
  net::HttpRequest internal{"POST", intake + "/api/v2/rum", {}, "batch"};

  run_task(interceptor, get, nullptr, 200, true);
  run_task(interceptor, post, &session, 404, false);
  run_task(interceptor, third, nullptr, 200, true);
  run_task(interceptor, internal, nullptr, 202, false);
  interceptor.flush();

  // Context snapshot
  context::ValuePublisher<context::TrackingConsent> consent{context::TrackingConsent::Pending};
  context::ValuePublisher<context::UserInfo> user{context::UserInfo{}};
  context::ValuePublisher<std::optional<context::NetworkConnectionInfo>> network{std::nullopt};
  context::ValuePublisher<std::optional<context::CarrierInfo>> carrier{std::nullopt};
  context::ValuePublisher<std::optional<context::ViewEvent>> view{std::nullopt};
  context::SnapshotStore store({consent, user, network, carrier, view});

  consent.set(context::TrackingConsent::Granted);
  user.set(context::UserInfo{"u-1", "Ada", std::nullopt, {}});
  view.set(context::ViewEvent{"v-1", "/home", "Home", std::chrono::system_clock::now(), {}});
  store.flush();
  const auto snap = store.current();

  const auto c = obs::make_simple_observer()->snapshot();
  std::cout << "--------------------------------------------------\n"
            << "started=" << c.started << " completed=" << c.completed
            << " injected=" << c.injected << " skipped_internal=" << c.skipped_internal
            << " in_flight=" << interceptor.in_flight() << '\n'
            << "context: consent=" << static_cast<int>(snap.tracking_consent)
            << " user=" << snap.user_info.id.value_or("-")
            << " view=" << (snap.last_view_event ? snap.last_view_event->view_name : std::string("-"))
            << std::endl;
  return 0;
}
