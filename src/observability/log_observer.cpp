#include "hermit/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace hermit::observability {

namespace {

void log_line(const std::string &level, const std::string &message) {
  std::cerr << ("[" + level + "] " + message + "\n");
}

std::string bool_text(bool value) { return value ? "true" : "false"; }

} // namespace

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, InvocationStartEvent>) {
          log_line("INFO", "invocation.start workspace=" + evt.workspace +
                               " resumed=" + bool_text(evt.resumed) + " origin=" + evt.origin);
        } else if constexpr (std::is_same_v<T, InvocationEndEvent>) {
          log_line(evt.success ? "INFO" : "WARN",
                   "invocation.end workspace=" + evt.workspace +
                       " duration_ms=" + std::to_string(evt.duration.count()) +
                       " success=" + bool_text(evt.success) +
                       " timed_out=" + bool_text(evt.timed_out));
        } else if constexpr (std::is_same_v<T, TaskFiredEvent>) {
          log_line("INFO", "task.fired id=" + evt.task_id + " workspace=" + evt.workspace +
                               " trigger=" + evt.trigger);
        } else if constexpr (std::is_same_v<T, RequestEvent>) {
          log_line("DEBUG", "request cmd=" + evt.command + " code=" + evt.code +
                                " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, SchedulerTickEvent>) {
          log_line("DEBUG", "scheduler.tick due=" + std::to_string(evt.due));
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, ActiveInvocationsMetric>) {
          log_line("DEBUG", "metric.active_invocations=" + std::to_string(m.count));
        } else if constexpr (std::is_same_v<T, QueueDepthMetric>) {
          log_line("DEBUG", "metric.queue_depth workspace=" + m.workspace +
                                " depth=" + std::to_string(m.depth));
        }
      },
      metric);
}

} // namespace hermit::observability
