#include "test_framework.hpp"

#include "hermit/common/json_util.hpp"
#include "hermit/config/schema.hpp"
#include "hermit/health/health.hpp"
#include "hermit/observability/factory.hpp"
#include "hermit/observability/global.hpp"
#include "hermit/observability/log_observer.hpp"
#include "hermit/observability/multi_observer.hpp"
#include "hermit/observability/noop_observer.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace {

struct CounterState {
  int events = 0;
  int metrics = 0;
  int flushes = 0;
  std::string last_command;
};

class CountingObserver final : public hermit::observability::IObserver {
public:
  explicit CountingObserver(CounterState *state) : state_(state) {}

  void record_event(const hermit::observability::ObserverEvent &event) override {
    ++state_->events;
    if (const auto *request = std::get_if<hermit::observability::RequestEvent>(&event)) {
      state_->last_command = request->command;
    }
  }
  void record_metric(const hermit::observability::ObserverMetric &) override {
    ++state_->metrics;
  }
  void flush() override { ++state_->flushes; }
  [[nodiscard]] std::string_view name() const override { return "counting"; }

private:
  CounterState *state_ = nullptr;
};

} // namespace

void register_observability_health_tests(std::vector<hermit::tests::TestCase> &tests) {
  using hermit::tests::require;
  namespace ob = hermit::observability;
  namespace hl = hermit::health;

  tests.push_back({"observability_record_helpers_reach_global_observer", [] {
                     CounterState state;
                     ob::set_global_observer(std::make_unique<CountingObserver>(&state));
                     ob::record_invocation_start("default", false, "ipc");
                     ob::record_invocation_end("default", std::chrono::milliseconds(12), true,
                                               false);
                     ob::record_task_fired("abcd1234", "default", "@hourly");
                     ob::record_request("send", "ok", std::chrono::milliseconds(3));
                     ob::record_scheduler_tick(2);
                     ob::record_error("store", "disk full");
                     ob::record_metric(ob::ActiveInvocationsMetric{.count = 1});
                     require(state.events == 6, "six events expected");
                     require(state.metrics == 1, "one metric expected");
                     require(state.last_command == "send", "request event payload");

                     // Reset before the local CounterState goes out of scope
                     ob::set_global_observer(nullptr);
                     require(state.flushes == 1, "replaced observer is flushed");
                     ob::record_error("store", "dropped");
                     require(state.events == 6, "no observer, no delivery");
                   }});

  tests.push_back({"observability_multi_forwards_to_children", [] {
                     CounterState one;
                     CounterState two;
                     ob::MultiObserver multi;
                     multi.add(std::make_unique<CountingObserver>(&one));
                     multi.add(std::make_unique<CountingObserver>(&two));
                     multi.add(nullptr);
                     require(multi.size() == 2, "null children are ignored");

                     multi.record_event(ob::ErrorEvent{.component = "unit", .message = "boom"});
                     multi.record_metric(ob::QueueDepthMetric{.workspace = "w", .depth = 3});
                     multi.flush();
                     require(one.events == 1 && two.events == 1, "event should be forwarded");
                     require(one.metrics == 1 && two.metrics == 1, "metric should be forwarded");
                     require(one.flushes == 1 && two.flushes == 1, "flush should be forwarded");
                   }});

  tests.push_back({"observability_factory_selects_backend", [] {
                     hermit::config::Config config;
                     config.observability.backend = "none";
                     require(ob::create_observer(config)->name() == "noop", "none maps to noop");
                     config.observability.backend = "noop";
                     require(ob::create_observer(config)->name() == "noop", "noop");
                     config.observability.backend = "LOG";
                     require(ob::create_observer(config)->name() == "log", "log backend");
                     config.observability.backend = "log, log";
                     auto multi = ob::create_observer(config);
                     require(multi->name() == "multi", "comma list is multi");
                   }});

  tests.push_back({"observability_log_observer_accepts_every_event", [] {
                     ob::LogObserver observer;
                     observer.record_event(ob::InvocationStartEvent{.workspace = "w"});
                     observer.record_event(ob::InvocationEndEvent{.workspace = "w"});
                     observer.record_event(ob::TaskFiredEvent{.task_id = "t"});
                     observer.record_event(ob::RequestEvent{.command = "status"});
                     observer.record_event(ob::SchedulerTickEvent{.due = 1});
                     observer.record_event(ob::ErrorEvent{.component = "c", .message = "m"});
                     observer.record_metric(ob::ActiveInvocationsMetric{.count = 2});
                     observer.record_metric(ob::QueueDepthMetric{.workspace = "w", .depth = 1});
                     require(observer.name() == "log", "name");
                   }});

  tests.push_back({"health_component_lifecycle", [] {
                     hl::clear();
                     require(!hl::get_component("ipc").has_value(), "unknown before marking");

                     hl::mark_component_starting("ipc");
                     require(hl::get_component("ipc")->status == "starting", "starting");
                     hl::mark_component_error("ipc", "bind failed");
                     auto errored = hl::get_component("ipc");
                     require(errored->status == "error" && errored->last_error == "bind failed",
                             "error recorded");
                     hl::bump_component_restart("ipc");
                     hl::mark_component_ok("ipc");
                     auto ok = hl::get_component("ipc");
                     require(ok->status == "ok" && !ok->last_error.has_value(), "ok clears error");
                     require(ok->restart_count == 1, "restart counted");
                     require(ok->last_ok.has_value(), "last_ok stamped");

                     hl::reset_component("ipc");
                     require(!hl::get_component("ipc").has_value(), "reset removes");
                     hl::clear();
                   }});

  tests.push_back({"health_components_json_is_sorted", [] {
                     hl::clear();
                     hl::mark_component_ok("scheduler");
                     hl::mark_component_error("ipc", "quote \" inside");
                     const auto json = hl::components_json();
                     require(json.find("\"ipc\"") < json.find("\"scheduler\""), "sorted names");
                     const auto parsed = hermit::common::json_parse_flat(json);
                     require(parsed.size() == 2, "two components");
                     const auto ipc = hermit::common::json_parse_flat(parsed.at("ipc"));
                     require(ipc.at("last_error") == "quote \" inside", "escaped error");
                     require(hl::snapshot().components.size() == 2, "snapshot");
                     hl::clear();
                     require(hl::components_json() == "{}", "empty after clear");
                   }});
}
