#pragma once

#include "hermit/common/result.hpp"

#include <string>

namespace hermit::agent {

enum class InvokeFailureKind {
  Helper,
  Timeout,
  Malformed,
  AgentError,
};

[[nodiscard]] std::string invoke_failure_kind_to_string(InvokeFailureKind kind);

struct InvokeFailure {
  InvokeFailureKind kind = InvokeFailureKind::Helper;
  std::string message;
};

/// Fields of the agent's final JSON result object.
struct AgentReply {
  std::string result;
  std::string session_id;
  bool is_error = false;
};

/// Accepts a single result object, a JSON array of events (the last
/// `"type":"result"` object wins) or log noise followed by the object on its
/// own line. Fails when no JSON object can be found.
[[nodiscard]] common::Result<AgentReply> parse_agent_output(const std::string &stdout_text);

} // namespace hermit::agent
