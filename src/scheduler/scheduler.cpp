#include "hermit/scheduler/scheduler.hpp"

#include "hermit/health/health.hpp"
#include "hermit/observability/global.hpp"
#include "hermit/scheduler/trigger.hpp"

#include <algorithm>
#include <iostream>

namespace hermit::scheduler {

Scheduler::Scheduler(store::Store &store, agent::SessionRunner &runner, SchedulerConfig config)
    : store_(store), runner_(runner), config_(config) {}

Scheduler::~Scheduler() { stop(); }

void Scheduler::start() {
  if (running_) {
    return;
  }
  running_ = true;
  health::mark_component_starting("scheduler");
  thread_ = std::thread([this]() { run_loop(); });
}

void Scheduler::stop() {
  running_ = false;
  if (thread_.joinable()) {
    thread_.join();
  }
}

bool Scheduler::is_running() const { return running_; }

void Scheduler::run_loop() {
  while (running_) {
    (void)tick(common::Clock::now());
    const auto wait_steps = std::max<long long>(1, config_.poll_interval.count() / 100);
    for (long long i = 0; i < wait_steps && running_; ++i) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
  }
}

TickReport Scheduler::tick(const common::TimePoint now) {
  TickReport report;
  auto due = store_.due_tasks(now);
  if (!due.ok()) {
    health::mark_component_error("scheduler", due.error());
    observability::record_error("scheduler", due.error());
    return report;
  }
  report.due = due.value().size();
  observability::record_scheduler_tick(report.due);

  for (const auto &task : due.value()) {
    if (!running_ && thread_.joinable()) {
      break;
    }
    fire(task, now, report);
  }
  health::mark_component_ok("scheduler");
  return report;
}

void Scheduler::fire(const store::Task &task, const common::TimePoint now, TickReport &report) {
  auto trigger = parse_trigger(task.trigger, now);
  std::optional<common::TimePoint> next_run;
  if (trigger.ok()) {
    next_run = next_after(trigger.value(), now, task.next_run);
  } else {
    std::cerr << "[scheduler] task " << task.id << " has an unreadable trigger, running once: "
              << trigger.error() << "\n";
  }

  auto lease = runner_.acquire(task.workspace, config_.busy_policy);
  if (!lease.ok()) {
    if (next_run.has_value()) {
      auto deferred = store_.defer_task(task.id, *next_run);
      if (!deferred.ok()) {
        std::cerr << "[scheduler] defer failed task=" << task.id << " error=" << deferred.error()
                  << "\n";
      }
      ++report.deferred;
    } else {
      ++report.skipped;
    }
    std::cerr << "[scheduler] workspace busy, task " << task.id
              << (next_run.has_value() ? " deferred" : " stays due") << "\n";
    return;
  }

  auto claimed = store_.claim_task(task.id, now, next_run);
  if (!claimed.ok()) {
    std::cerr << "[scheduler] claim failed task=" << task.id << " error=" << claimed.error()
              << "\n";
    ++report.skipped;
    return;
  }
  if (!claimed.value()) {
    ++report.skipped;
    return;
  }

  observability::record_task_fired(task.id, task.workspace, task.trigger);
  ++report.fired;
  const auto outcome =
      runner_.run_turn(lease.value(), task.workspace, task.prompt,
                       agent::TurnContext{.origin = "scheduler", .task_id = task.id});
  std::string result = outcome.reply;
  if (!outcome.ok()) {
    ++report.failed;
    result = "error: " + outcome.message;
    std::cerr << "[scheduler] task " << task.id << " failed ("
              << agent::turn_status_to_string(outcome.status) << "): " << outcome.message << "\n";
  }
  auto recorded = store_.record_task_result(task.id, result);
  if (!recorded.ok()) {
    std::cerr << "[scheduler] record result failed task=" << task.id
              << " error=" << recorded.error() << "\n";
  }
}

} // namespace hermit::scheduler
