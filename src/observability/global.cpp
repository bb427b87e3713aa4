#include "hermit/observability/global.hpp"

#include <mutex>

namespace hermit::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  if (g_observer != nullptr) {
    g_observer->flush();
  }
  g_observer = std::move(observer);
}

void record_event(const ObserverEvent &event) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  if (g_observer != nullptr) {
    g_observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  if (g_observer != nullptr) {
    g_observer->record_metric(metric);
  }
}

void record_invocation_start(const std::string &workspace, const bool resumed,
                             const std::string &origin) {
  record_event(
      InvocationStartEvent{.workspace = workspace, .resumed = resumed, .origin = origin});
}

void record_invocation_end(const std::string &workspace, std::chrono::milliseconds duration,
                           const bool success, const bool timed_out) {
  record_event(InvocationEndEvent{
      .workspace = workspace, .duration = duration, .success = success, .timed_out = timed_out});
}

void record_task_fired(const std::string &task_id, const std::string &workspace,
                       const std::string &trigger) {
  record_event(TaskFiredEvent{.task_id = task_id, .workspace = workspace, .trigger = trigger});
}

void record_request(const std::string &command, const std::string &code,
                    std::chrono::milliseconds duration) {
  record_event(RequestEvent{.command = command, .code = code, .duration = duration});
}

void record_scheduler_tick(const std::size_t due) { record_event(SchedulerTickEvent{.due = due}); }

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace hermit::observability
