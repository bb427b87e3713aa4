#pragma once

#include "hermit/observability/observer.hpp"

#include <memory>

namespace hermit::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_invocation_start(const std::string &workspace, bool resumed,
                             const std::string &origin);
void record_invocation_end(const std::string &workspace, std::chrono::milliseconds duration,
                           bool success, bool timed_out);
void record_task_fired(const std::string &task_id, const std::string &workspace,
                       const std::string &trigger);
void record_request(const std::string &command, const std::string &code,
                    std::chrono::milliseconds duration);
void record_scheduler_tick(std::size_t due);
void record_error(const std::string &component, const std::string &message);

} // namespace hermit::observability
