#pragma once

#include "hermit/agent/session_runner.hpp"
#include "hermit/common/time.hpp"
#include "hermit/store/store.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <thread>

namespace hermit::scheduler {

struct SchedulerConfig {
  std::chrono::milliseconds poll_interval{60000};
  /// Reject: a busy workspace never blocks the loop.
  agent::BusyPolicy busy_policy = agent::BusyPolicy::Reject;
};

struct TickReport {
  std::size_t due = 0;
  std::size_t fired = 0;
  std::size_t failed = 0;
  std::size_t deferred = 0;
  std::size_t skipped = 0;
};

/// Background loop that fires due tasks through the session runner. Each
/// firing is claimed in the store before the agent runs, so a task fires at
/// most once per scheduled time even across restarts.
class Scheduler {
public:
  Scheduler(store::Store &store, agent::SessionRunner &runner, SchedulerConfig config = {});
  ~Scheduler();

  Scheduler(const Scheduler &) = delete;
  Scheduler &operator=(const Scheduler &) = delete;

  void start();
  void stop();
  [[nodiscard]] bool is_running() const;

  /// One evaluation pass over the tasks due at `now`.
  TickReport tick(common::TimePoint now);

private:
  void run_loop();
  void fire(const store::Task &task, common::TimePoint now, TickReport &report);

  store::Store &store_;
  agent::SessionRunner &runner_;
  SchedulerConfig config_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

} // namespace hermit::scheduler
