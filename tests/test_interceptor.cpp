/**
 * @file test_interceptor.cpp
 * @brief Tests for Interceptor request modification and lifecycle correlation.
 *
 * Validates:
 *  - Header injection matrix (tracing / RUM / tracer registration)
 *  - Internal requests are never modified nor tracked
 *  - Exactly one start and one completion per task, whatever the callback order
 *  - Duplicate and orphan callbacks are ignored
 *  - Many concurrent tasks complete independently
 */
#include <gtest/gtest.h>
#include <chrono>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "beacon/config/config_loader.hpp"
#include "beacon/config/constants.hpp"
#include "beacon/interception/interceptor.hpp"

using namespace beacon::interception;
using beacon::config::AutoInstrumentationConfig;
using beacon::net::HttpRequest;
using beacon::net::HttpResponse;
namespace constants = beacon::config::constants;

namespace {

/// Stores copies of every notification; safe to read after flush().
class RecordingHandler final : public InterceptionHandler {
public:
  void notify_interception_started(const TaskInterception& i) override {
    std::lock_guard<std::mutex> lk(mu);
    started.push_back(i);
  }
  void notify_interception_completed(const TaskInterception& i) override {
    std::lock_guard<std::mutex> lk(mu);
    completed.push_back(i);
  }

  std::size_t started_count() { std::lock_guard<std::mutex> lk(mu); return started.size(); }
  std::size_t completed_count() { std::lock_guard<std::mutex> lk(mu); return completed.size(); }

  std::mutex mu;
  std::vector<TaskInterception> started;
  std::vector<TaskInterception> completed;
};

/// Counts engine decisions without printing.
class CountingObserver final : public beacon::obs::Observer {
public:
  void record(const beacon::obs::InterceptionEvent& e) override {
    std::lock_guard<std::mutex> lk(mu_);
    switch (e.kind) {
      case beacon::obs::EventKind::Started:         ctr_.started++;          break;
      case beacon::obs::EventKind::Completed:       ctr_.completed++;        break;
      case beacon::obs::EventKind::SkippedInternal: ctr_.skipped_internal++; break;
      case beacon::obs::EventKind::OrphanCallback:  ctr_.orphan_callbacks++; break;
      case beacon::obs::EventKind::Injected:        ctr_.injected++;         break;
    }
  }
  beacon::obs::Counters snapshot() const override {
    std::lock_guard<std::mutex> lk(mu_);
    return ctr_;
  }
private:
  mutable std::mutex mu_;
  beacon::obs::Counters ctr_;
};

const std::string kIntake   = "https://intake.example.com";
const std::string kFirst    = "https://api.example.com/v1/items";
const std::string kThird    = "https://cdn.other.org/lib.js";
const std::string kInternal = "https://intake.example.com/api/v2/rum";

AutoInstrumentationConfig make_cfg(bool tracing, bool rum) {
  AutoInstrumentationConfig cfg;
  cfg.first_party_hosts  = {"example.com"};
  cfg.sdk_internal_urls  = {kIntake};
  cfg.instrument_tracing = tracing;
  cfg.instrument_rum     = rum;
  return cfg;
}

HttpRequest get_request(const std::string& url) { return HttpRequest{"GET", url, {}, {}}; }

ResourceMetrics some_metrics() {
  ResourceMetrics m;
  const auto t0 = std::chrono::system_clock::now();
  m.fetch = DateInterval{t0, t0 + std::chrono::milliseconds(5)};
  m.response_size = 512;
  return m;
}

std::shared_ptr<beacon::tracing::Tracer> seeded_tracer() {
  return std::make_shared<beacon::tracing::RandomTracer>(42);
}

} // namespace

// --------------------------- modify() -------------------------------------

TEST(InterceptorModify, TracingAndRum_AddsThreeHeaders) {
  auto handler = std::make_shared<RecordingHandler>();
  Interceptor i(make_cfg(true, true), handler, seeded_tracer());

  const auto out = i.modify(get_request(kFirst));
  EXPECT_EQ(out.headers.size(), 3u);
  EXPECT_TRUE(out.header(constants::TRACE_ID_HEADER));
  EXPECT_TRUE(out.header(constants::PARENT_SPAN_ID_HEADER));
  EXPECT_EQ(out.header(constants::ORIGIN_HEADER), std::string(constants::RUM_ORIGIN_VALUE));
  EXPECT_EQ(out.url, kFirst);
  EXPECT_EQ(out.method, "GET");
}

TEST(InterceptorModify, TracingOnly_AddsTwoHeaders_KeepsExisting) {
  auto handler = std::make_shared<RecordingHandler>();
  Interceptor i(make_cfg(true, false), handler, seeded_tracer());
  EXPECT_TRUE(i.additional_first_party_headers().empty());

  auto req = get_request(kFirst);
  req.set_header("Accept", "application/json");
  const auto out = i.modify(req);
  EXPECT_EQ(out.headers.size(), 3u);
  EXPECT_EQ(out.header("Accept"), std::string("application/json"));
  EXPECT_FALSE(out.header(constants::ORIGIN_HEADER));
}

TEST(InterceptorModify, RumOnly_LeavesRequestUnchanged) {
  auto handler = std::make_shared<RecordingHandler>();
  Interceptor i(make_cfg(false, true), handler, seeded_tracer());
  EXPECT_FALSE(i.injects_tracing_headers());
  EXPECT_EQ(i.modify(get_request(kFirst)), get_request(kFirst));
}

TEST(InterceptorModify, NoTracerRegistered_LeavesRequestUnchanged) {
  auto handler = std::make_shared<RecordingHandler>();
  Interceptor i(make_cfg(true, true), handler);
  EXPECT_EQ(i.modify(get_request(kFirst)), get_request(kFirst));

  i.update_tracer(seeded_tracer());
  EXPECT_EQ(i.modify(get_request(kFirst)).headers.size(), 3u);
  i.update_tracer(nullptr);
  EXPECT_FALSE(i.tracer()->enabled());
  EXPECT_EQ(i.modify(get_request(kFirst)), get_request(kFirst));
}

TEST(InterceptorModify, ThirdPartyAndInternal_Unchanged) {
  auto handler = std::make_shared<RecordingHandler>();
  Interceptor i(make_cfg(true, true), handler, seeded_tracer());
  EXPECT_EQ(i.modify(get_request(kThird)), get_request(kThird));
  EXPECT_EQ(i.modify(get_request(kInternal)), get_request(kInternal));
  EXPECT_EQ(i.modify(get_request("not a url")), get_request("not a url"));
}

TEST(InterceptorModify, InternalWinsOverFirstParty) {
  auto cfg = make_cfg(true, false);
  cfg.first_party_hosts.insert("intake.example.com");
  Interceptor i(cfg, std::make_shared<RecordingHandler>(), seeded_tracer());
  EXPECT_EQ(i.modify(get_request(kInternal)), get_request(kInternal));
}

TEST(InterceptorModify, SessionHosts_WidenFirstParty) {
  auto handler = std::make_shared<RecordingHandler>();
  Interceptor i(make_cfg(true, false), handler, seeded_tracer());
  const InstrumentedSession session(std::set<std::string>{"cdn.other.org"});
  const InstrumentedSession plain;

  EXPECT_EQ(i.modify(get_request(kThird), &plain), get_request(kThird));
  EXPECT_EQ(i.modify(get_request(kThird), &session).headers.size(), 2u);
}

TEST(InterceptorModify, EachCallMintsNewContext) {
  Interceptor i(make_cfg(true, false), std::make_shared<RecordingHandler>(), seeded_tracer());
  const auto a = i.modify(get_request(kFirst));
  const auto b = i.modify(get_request(kFirst));
  EXPECT_NE(a.header(constants::TRACE_ID_HEADER), b.header(constants::TRACE_ID_HEADER));
}

/**
 * @test InterceptorModify_MixedCaseTraceHeaders
 * @brief Existing trace headers in any case are replaced, never duplicated.
 */
TEST(InterceptorModify, MixedCaseTraceHeaders_ReplacedNotDuplicated) {
  Interceptor i(make_cfg(true, false), std::make_shared<RecordingHandler>(), seeded_tracer());

  auto req = get_request("https://api.example.com/x");
  req.set_header("X-Datadog-Trace-Id", "11");
  req.set_header("X-Datadog-Parent-Id", "22");
  const auto out = i.modify(req);

  EXPECT_EQ(out.headers.size(), 2u);
  const auto trace  = out.header(constants::TRACE_ID_HEADER);
  const auto parent = out.header(constants::PARENT_SPAN_ID_HEADER);
  ASSERT_TRUE(trace);
  ASSERT_TRUE(parent);
  EXPECT_NE(*trace, "11");
  EXPECT_NE(*parent, "22");
  EXPECT_EQ(out.header("X-DATADOG-TRACE-ID"), trace);
}

// --------------------------- lifecycle ------------------------------------

TEST(InterceptorLifecycle, MetricsThenCompletion_OneStartOneCompletion) {
  auto handler = std::make_shared<RecordingHandler>();
  CountingObserver observer;
  Interceptor i(make_cfg(true, false), handler, seeded_tracer(), &observer);

  SessionTask task(i.modify(get_request(kFirst)));
  task.set_response(HttpResponse{200, {}, "application/json"});
  i.task_created(task);
  i.task_metrics_collected(task, some_metrics());
  i.task_completed(task, std::nullopt);
  i.flush();

  ASSERT_EQ(handler->started.size(), 1u);
  ASSERT_EQ(handler->completed.size(), 1u);
  EXPECT_FALSE(handler->started[0].metrics());
  EXPECT_FALSE(handler->started[0].completion());

  const auto& done = handler->completed[0];
  EXPECT_EQ(done.task_id(), task.id());
  EXPECT_TRUE(done.is_first_party());
  EXPECT_TRUE(done.is_done());
  ASSERT_TRUE(done.span_context());
  EXPECT_EQ(std::to_string(done.span_context()->trace_id),
            *task.original_request()->header(constants::TRACE_ID_HEADER));
  ASSERT_TRUE(done.completion()->response);
  EXPECT_EQ(done.completion()->response->status_code, 200);
  EXPECT_EQ(done.metrics()->response_size, 512u);
  EXPECT_EQ(i.in_flight(), 0u);

  const auto c = observer.snapshot();
  EXPECT_EQ(c.injected, 1u);
  EXPECT_EQ(c.started, 1u);
  EXPECT_EQ(c.completed, 1u);
}

TEST(InterceptorLifecycle, CompletionThenMetrics_SameResult) {
  auto handler = std::make_shared<RecordingHandler>();
  Interceptor i(make_cfg(true, false), handler, seeded_tracer());

  SessionTask task(get_request(kThird));
  i.task_created(task);
  i.task_completed(task, TaskError{-1001, "transport", "timed out"});
  i.flush();
  EXPECT_EQ(handler->completed_count(), 0u);

  i.task_metrics_collected(task, some_metrics());
  i.flush();
  ASSERT_EQ(handler->started_count(), 1u);
  ASSERT_EQ(handler->completed_count(), 1u);
  const auto& done = handler->completed[0];
  EXPECT_FALSE(done.is_first_party());
  EXPECT_FALSE(done.span_context());
  EXPECT_FALSE(done.completion()->response);
  ASSERT_TRUE(done.completion()->error);
  EXPECT_EQ(done.completion()->error->code, -1001);
}

TEST(InterceptorLifecycle, OnlyOneHalf_NoCompletion_StaysInFlight) {
  auto handler = std::make_shared<RecordingHandler>();
  Interceptor i(make_cfg(true, false), handler, seeded_tracer());

  SessionTask a(get_request(kFirst));
  SessionTask b(get_request(kFirst));
  i.task_created(a);
  i.task_created(b);
  i.task_metrics_collected(a, some_metrics());
  i.task_completed(b, std::nullopt);
  i.flush();

  EXPECT_EQ(handler->started_count(), 2u);
  EXPECT_EQ(handler->completed_count(), 0u);
  EXPECT_EQ(i.in_flight(), 2u);
}

TEST(InterceptorLifecycle, InternalRequest_NoNotifications) {
  auto handler = std::make_shared<RecordingHandler>();
  CountingObserver observer;
  Interceptor i(make_cfg(true, true), handler, seeded_tracer(), &observer);

  SessionTask task(get_request(kInternal));
  i.task_created(task);
  i.task_metrics_collected(task, some_metrics());
  i.task_completed(task, std::nullopt);
  i.flush();

  EXPECT_EQ(handler->started_count(), 0u);
  EXPECT_EQ(handler->completed_count(), 0u);
  EXPECT_EQ(i.in_flight(), 0u);
  EXPECT_EQ(observer.snapshot().skipped_internal, 1u);
  EXPECT_EQ(observer.snapshot().orphan_callbacks, 0u);
}

TEST(InterceptorLifecycle, TaskWithoutRequest_Ignored) {
  auto handler = std::make_shared<RecordingHandler>();
  CountingObserver observer;
  Interceptor i(make_cfg(true, false), handler, seeded_tracer(), &observer);

  SessionTask task(std::nullopt);
  i.task_created(task);
  i.task_metrics_collected(task, some_metrics());
  i.task_completed(task, std::nullopt);
  i.flush();

  EXPECT_EQ(handler->started_count(), 0u);
  EXPECT_EQ(handler->completed_count(), 0u);
  EXPECT_EQ(observer.snapshot().orphan_callbacks, 2u);
}

TEST(InterceptorLifecycle, DuplicateAndLateCallbacks_Ignored) {
  auto handler = std::make_shared<RecordingHandler>();
  CountingObserver observer;
  Interceptor i(make_cfg(true, false), handler, seeded_tracer(), &observer);

  SessionTask task(get_request(kFirst));
  i.task_created(task);
  i.task_created(task);
  i.task_metrics_collected(task, some_metrics());
  i.task_completed(task, std::nullopt);
  // Record is gone: these find nothing.
  i.task_completed(task, std::nullopt);
  i.task_metrics_collected(task, some_metrics());
  i.flush();

  EXPECT_EQ(handler->started_count(), 1u);
  EXPECT_EQ(handler->completed_count(), 1u);
  EXPECT_EQ(observer.snapshot().orphan_callbacks, 2u);
  EXPECT_EQ(i.in_flight(), 0u);
}

TEST(InterceptorLifecycle, SessionHosts_MarkFirstParty) {
  auto handler = std::make_shared<RecordingHandler>();
  Interceptor i(make_cfg(false, true), handler);
  auto session = std::make_unique<InstrumentedSession>(std::set<std::string>{"other.org"});

  SessionTask task(get_request(kThird));
  i.task_created(task, session.get());
  session.reset();  // queued work keeps its own reference to the hosts
  i.task_metrics_collected(task, some_metrics());
  i.task_completed(task, std::nullopt);
  i.flush();

  ASSERT_EQ(handler->completed_count(), 1u);
  EXPECT_TRUE(handler->completed[0].is_first_party());
}

/**
 * @test InterceptorLifecycle_ConcurrentTasks
 * @brief Many tasks, callbacks delivered from racing threads in both orders.
 */
TEST(InterceptorLifecycle, ConcurrentTasks_EachCompletesExactlyOnce) {
  auto handler = std::make_shared<RecordingHandler>();
  Interceptor i(make_cfg(true, true), handler, seeded_tracer());

  constexpr int P = 4, N = 250;
  std::vector<std::thread> threads;
  for (int p = 0; p < P; ++p) {
    threads.emplace_back([&i] {
      for (int n = 0; n < N; ++n) {
        SessionTask task(i.modify(get_request((n % 2) ? kFirst : kThird)));
        i.task_created(task);
        std::thread metrics([&] { i.task_metrics_collected(task, some_metrics()); });
        std::thread done([&] { i.task_completed(task, std::nullopt); });
        metrics.join();
        done.join();
      }
    });
  }
  for (auto& t : threads) t.join();
  i.flush();

  EXPECT_EQ(handler->started_count(), static_cast<std::size_t>(P * N));
  ASSERT_EQ(handler->completed_count(), static_cast<std::size_t>(P * N));
  std::set<TaskId> ids;
  for (const auto& c : handler->completed) {
    ids.insert(c.task_id());
    EXPECT_EQ(c.is_first_party(), c.span_context().has_value());
  }
  EXPECT_EQ(ids.size(), static_cast<std::size_t>(P * N));
  EXPECT_EQ(i.in_flight(), 0u);
}

TEST(InterceptorLifecycle, Destructor_DeliversQueuedCallbacks) {
  auto handler = std::make_shared<RecordingHandler>();
  {
    Interceptor i(make_cfg(true, false), handler, seeded_tracer());
    for (int n = 0; n < 100; ++n) {
      SessionTask task(get_request(kFirst));
      i.task_created(task);
      i.task_metrics_collected(task, some_metrics());
      i.task_completed(task, std::nullopt);
    }
  }
  EXPECT_EQ(handler->completed_count(), 100u);
}

TEST(InterceptorLifecycle, MixedCaseTraceHeaders_Extracted) {
  auto handler = std::make_shared<RecordingHandler>();
  Interceptor i(make_cfg(true, false), handler, seeded_tracer());

  auto req = get_request("https://api.example.com/x");
  req.set_header("X-Datadog-Trace-Id", "11");
  req.set_header("X-Datadog-Parent-Id", "22");
  SessionTask task(req);
  i.task_created(task);
  i.flush();

  ASSERT_EQ(handler->started_count(), 1u);
  ASSERT_TRUE(handler->started[0].span_context());
  EXPECT_EQ(handler->started[0].span_context()->trace_id, 11u);
  EXPECT_EQ(handler->started[0].span_context()->span_id, 22u);
}

TEST(InterceptorLifecycle, NullHandler_TasksStillCorrelated) {
  CountingObserver observer;
  Interceptor i(make_cfg(true, false), nullptr, seeded_tracer(), &observer);

  SessionTask task(i.modify(get_request(kFirst)));
  i.task_created(task);
  i.task_metrics_collected(task, some_metrics());
  i.task_completed(task, std::nullopt);
  i.flush();

  EXPECT_EQ(i.in_flight(), 0u);
  EXPECT_EQ(observer.snapshot().started, 1u);
  EXPECT_EQ(observer.snapshot().completed, 1u);
}
