#include "hermit/agent/session_runner.hpp"

#include <iostream>

namespace hermit::agent {

namespace {

TurnOutcome failed_turn(const TurnStatus status, std::string message) {
  TurnOutcome outcome;
  outcome.status = status;
  outcome.message = std::move(message);
  return outcome;
}

} // namespace

common::Result<BusyPolicy> parse_busy_policy(const std::string &value) {
  if (value == "queue") {
    return common::Result<BusyPolicy>::success(BusyPolicy::Queue);
  }
  if (value == "reject" || value == "defer") {
    return common::Result<BusyPolicy>::success(BusyPolicy::Reject);
  }
  return common::Result<BusyPolicy>::failure("unknown busy policy: " + value);
}

std::string turn_status_to_string(const TurnStatus status) {
  switch (status) {
  case TurnStatus::Ok:
    return "ok";
  case TurnStatus::Busy:
    return "busy";
  case TurnStatus::InvalidWorkspace:
    return "invalid_workspace";
  case TurnStatus::InvocationFailed:
    return "invocation_failed";
  case TurnStatus::Timeout:
    return "timeout";
  case TurnStatus::StoreError:
    return "store_error";
  }
  return "internal_error";
}

SessionRunner::SessionRunner(const config::Config &config, store::Store &store,
                             WorkspaceLocks &locks, AgentInvoker &invoker)
    : config_(config), store_(store), locks_(locks), invoker_(invoker) {}

common::Result<WorkspaceLocks::Lease> SessionRunner::acquire(const std::string &workspace,
                                                             const BusyPolicy policy) {
  if (policy == BusyPolicy::Reject) {
    auto lease = locks_.try_acquire(workspace);
    if (!lease.has_value()) {
      return common::Result<WorkspaceLocks::Lease>::failure("workspace '" + workspace +
                                                            "' is busy");
    }
    return common::Result<WorkspaceLocks::Lease>::success(std::move(*lease));
  }
  return locks_.acquire(workspace, config_.daemon.max_queue_depth,
                        std::chrono::seconds(config_.daemon.queue_wait_secs));
}

common::Result<store::Workspace> SessionRunner::resolve_workspace(const std::string &workspace,
                                                                  TurnStatus &failure_status) {
  auto valid = store::validate_workspace_name(workspace);
  if (!valid.ok()) {
    failure_status = TurnStatus::InvalidWorkspace;
    return common::Result<store::Workspace>::failure(valid.error());
  }
  auto resolved = store_.get_or_create_workspace(workspace);
  if (resolved.ok()) {
    return resolved;
  }
  failure_status = TurnStatus::StoreError;
  auto owner = store_.folder_owner(store::workspace_folder(workspace));
  if (owner.ok() && owner.value().has_value() && *owner.value() != workspace) {
    failure_status = TurnStatus::InvalidWorkspace;
  }
  return resolved;
}

TurnOutcome SessionRunner::run_turn(const WorkspaceLocks::Lease &lease,
                                    const std::string &workspace, const std::string &prompt,
                                    const TurnContext &context) {
  if (!lease.valid() || lease.workspace() != workspace) {
    return failed_turn(TurnStatus::Busy, "no execution lease held for '" + workspace + "'");
  }

  TurnStatus failure_status = TurnStatus::StoreError;
  auto resolved = resolve_workspace(workspace, failure_status);
  if (!resolved.ok()) {
    return failed_turn(failure_status, resolved.error());
  }

  auto session = store_.get_session(workspace);
  if (!session.ok()) {
    return failed_turn(TurnStatus::StoreError, session.error());
  }
  std::optional<std::string> resume;
  if (session.value().has_value()) {
    resume = session.value()->id;
  }

  auto invoked = invoker_.invoke(resolved.value(), prompt, resume, context);
  if (!invoked.ok()) {
    std::cerr << "[agent] invocation failed workspace=" << workspace
              << " kind=" << invoke_failure_kind_to_string(invoked.failure.kind)
              << " error=" << invoked.failure.message << "\n";
    return failed_turn(invoked.failure.kind == InvokeFailureKind::Timeout
                           ? TurnStatus::Timeout
                           : TurnStatus::InvocationFailed,
                       invoked.failure.message);
  }

  TurnOutcome outcome;
  outcome.reply = invoked.output->reply;
  outcome.session_id = invoked.output->session_id;
  outcome.resumed = resume.has_value();
  auto stored = store_.set_session(workspace, outcome.session_id);
  if (!stored.ok()) {
    outcome.status = TurnStatus::StoreError;
    outcome.message = "reply received but session was not saved: " + stored.error();
  }
  return outcome;
}

TurnOutcome SessionRunner::send(const std::string &workspace, const std::string &prompt,
                                const TurnContext &context, const BusyPolicy policy) {
  auto valid = store::validate_workspace_name(workspace);
  if (!valid.ok()) {
    return failed_turn(TurnStatus::InvalidWorkspace, valid.error());
  }
  auto lease = acquire(workspace, policy);
  if (!lease.ok()) {
    return failed_turn(TurnStatus::Busy, lease.error());
  }
  return run_turn(lease.value(), workspace, prompt, context);
}

} // namespace hermit::agent
