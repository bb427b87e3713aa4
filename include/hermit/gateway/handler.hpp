#pragma once

#include "hermit/agent/invoker.hpp"
#include "hermit/agent/session_runner.hpp"
#include "hermit/config/schema.hpp"
#include "hermit/gateway/protocol.hpp"
#include "hermit/store/store.hpp"

#include <chrono>
#include <string>

namespace hermit::gateway {

/// Maps decoded requests onto the store and the session runner. Safe to
/// call from many connection threads at once.
class RequestHandler {
public:
  RequestHandler(const config::Config &config, store::Store &store,
                 agent::SessionRunner &runner, const agent::AgentInvoker &invoker);

  /// Decodes, dispatches and never throws; exceptions become internal_error.
  [[nodiscard]] Response handle_line(const std::string &line);
  [[nodiscard]] Response dispatch(const Request &request);

private:
  [[nodiscard]] Response handle(const SendMessage &request);
  [[nodiscard]] Response handle(const StartInteractive &request);
  [[nodiscard]] Response handle(const ListWorkspaces &request);
  [[nodiscard]] Response handle(const ClearSession &request);
  [[nodiscard]] Response handle(const DaemonStatus &request);
  [[nodiscard]] Response handle(const AddTask &request);
  [[nodiscard]] Response handle(const ListTasks &request);
  [[nodiscard]] Response handle(const RemoveTask &request);

  [[nodiscard]] agent::BusyPolicy interactive_policy() const;

  const config::Config &config_;
  store::Store &store_;
  agent::SessionRunner &runner_;
  const agent::AgentInvoker &invoker_;
  std::chrono::steady_clock::time_point started_at_;
};

/// Response code for a failed turn.
[[nodiscard]] ErrorCode error_code_for(agent::TurnStatus status);

} // namespace hermit::gateway
