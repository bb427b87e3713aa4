#pragma once

#include "hermit/agent/output.hpp"
#include "hermit/config/schema.hpp"
#include "hermit/sandbox/process.hpp"
#include "hermit/store/store.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace hermit::agent {

/// Where a turn came from; recorded in the transcript metadata.
struct TurnContext {
  std::string origin = "ipc";
  std::string task_id;
};

struct InvocationOutput {
  std::string reply;
  std::string session_id;
  std::chrono::milliseconds duration{0};
};

struct InvokeResult {
  std::optional<InvocationOutput> output;
  InvokeFailure failure;

  [[nodiscard]] bool ok() const { return output.has_value(); }
};

/// Runs the agent binary once inside the sandbox helper. Callers hold the
/// workspace lease; the invoker itself keeps no per-workspace state.
class AgentInvoker {
public:
  AgentInvoker(const config::Config &config, sandbox::IProcessRunner &runner);

  [[nodiscard]] InvokeResult invoke(const store::Workspace &workspace, const std::string &prompt,
                                    const std::optional<std::string> &resume_session,
                                    const TurnContext &context = {});

  /// Agent command line inside the sandbox, before the helper wraps it.
  [[nodiscard]] std::vector<std::string>
  agent_command(const std::string &prompt, const std::optional<std::string> &resume_session) const;

  [[nodiscard]] std::uint64_t active_invocations() const { return active_; }

private:
  [[nodiscard]] InvokeResult run_sandboxed(const store::Workspace &workspace,
                                           const std::string &prompt,
                                           const std::optional<std::string> &resume_session);

  const config::Config &config_;
  sandbox::IProcessRunner &runner_;
  std::atomic<std::uint64_t> active_{0};
};

} // namespace hermit::agent
