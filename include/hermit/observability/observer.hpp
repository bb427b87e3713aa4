#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace hermit::observability {

struct InvocationStartEvent {
  std::string workspace;
  bool resumed = false;
  std::string origin;
};

struct InvocationEndEvent {
  std::string workspace;
  std::chrono::milliseconds duration{0};
  bool success = false;
  bool timed_out = false;
};

struct TaskFiredEvent {
  std::string task_id;
  std::string workspace;
  std::string trigger;
};

struct RequestEvent {
  std::string command;
  std::string code;
  std::chrono::milliseconds duration{0};
};

struct SchedulerTickEvent {
  std::size_t due = 0;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<InvocationStartEvent, InvocationEndEvent, TaskFiredEvent,
                                   RequestEvent, SchedulerTickEvent, ErrorEvent>;

struct ActiveInvocationsMetric {
  std::uint64_t count = 0;
};

struct QueueDepthMetric {
  std::string workspace;
  std::uint64_t depth = 0;
};

using ObserverMetric = std::variant<ActiveInvocationsMetric, QueueDepthMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace hermit::observability
