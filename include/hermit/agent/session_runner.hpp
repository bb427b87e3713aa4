#pragma once

#include "hermit/agent/invoker.hpp"
#include "hermit/agent/locks.hpp"
#include "hermit/config/schema.hpp"
#include "hermit/store/store.hpp"

#include <optional>
#include <string>

namespace hermit::agent {

/// What a caller does when the workspace is already running a turn.
enum class BusyPolicy {
  Queue,
  Reject,
};

/// "queue" -> Queue; "reject" and "defer" -> Reject.
[[nodiscard]] common::Result<BusyPolicy> parse_busy_policy(const std::string &value);

enum class TurnStatus {
  Ok,
  Busy,
  InvalidWorkspace,
  InvocationFailed,
  Timeout,
  StoreError,
};

[[nodiscard]] std::string turn_status_to_string(TurnStatus status);

struct TurnOutcome {
  TurnStatus status = TurnStatus::Ok;
  std::string reply;
  std::string session_id;
  std::string message;
  bool resumed = false;

  [[nodiscard]] bool ok() const { return status == TurnStatus::Ok; }
};

/// One conversational turn: resolve the workspace, resume its session,
/// invoke the agent and store the new session id. The session record only
/// changes after a successful invocation.
class SessionRunner {
public:
  SessionRunner(const config::Config &config, store::Store &store, WorkspaceLocks &locks,
                AgentInvoker &invoker);

  [[nodiscard]] common::Result<WorkspaceLocks::Lease> acquire(const std::string &workspace,
                                                              BusyPolicy policy);

  /// Runs under `lease`, which must be held for `workspace`.
  [[nodiscard]] TurnOutcome run_turn(const WorkspaceLocks::Lease &lease,
                                     const std::string &workspace, const std::string &prompt,
                                     const TurnContext &context);

  [[nodiscard]] TurnOutcome send(const std::string &workspace, const std::string &prompt,
                                 const TurnContext &context, BusyPolicy policy);

  /// Workspace lookup with failures split into invalid names and store errors.
  [[nodiscard]] common::Result<store::Workspace> resolve_workspace(const std::string &workspace,
                                                                   TurnStatus &failure_status);

private:
  const config::Config &config_;
  store::Store &store_;
  WorkspaceLocks &locks_;
  AgentInvoker &invoker_;
};

} // namespace hermit::agent
