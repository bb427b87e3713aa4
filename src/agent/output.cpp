#include "hermit/agent/output.hpp"

#include "hermit/common/fs.hpp"
#include "hermit/common/json_util.hpp"

#include <sstream>
#include <vector>

namespace hermit::agent {

namespace {

// `result` and `session_id` count only as JSON strings; a null or numeric
// session id reads as missing.
AgentReply reply_from_object(const std::string &object) {
  const auto fields = common::json_parse_flat(object);
  const auto strings = common::json_parse_string_members(object);
  AgentReply reply;
  if (const auto it = strings.find("result"); it != strings.end()) {
    reply.result = it->second;
  }
  if (const auto it = strings.find("session_id"); it != strings.end()) {
    reply.session_id = common::trim(it->second);
  }
  if (const auto it = fields.find("is_error"); it != fields.end()) {
    reply.is_error = common::trim(it->second) == "true";
  }
  if (const auto it = fields.find("subtype"); it != fields.end() && !reply.is_error) {
    reply.is_error = common::starts_with(it->second, "error");
  }
  return reply;
}

common::Result<AgentReply> parse_event_array(const std::string &text) {
  const auto objects = common::json_split_top_level_objects(text);
  if (objects.empty()) {
    return common::Result<AgentReply>::failure("agent output array has no objects");
  }
  for (auto it = objects.rbegin(); it != objects.rend(); ++it) {
    const auto fields = common::json_parse_flat(*it);
    const auto type = fields.find("type");
    if (type != fields.end() && type->second == "result") {
      return common::Result<AgentReply>::success(reply_from_object(*it));
    }
  }
  return common::Result<AgentReply>::failure("agent output has no result event");
}

} // namespace

std::string invoke_failure_kind_to_string(const InvokeFailureKind kind) {
  switch (kind) {
  case InvokeFailureKind::Helper:
    return "helper";
  case InvokeFailureKind::Timeout:
    return "timeout";
  case InvokeFailureKind::Malformed:
    return "malformed";
  case InvokeFailureKind::AgentError:
    return "agent_error";
  }
  return "helper";
}

common::Result<AgentReply> parse_agent_output(const std::string &stdout_text) {
  const std::string text = common::trim(stdout_text);
  if (text.empty()) {
    return common::Result<AgentReply>::failure("agent produced no output");
  }
  if (text.front() == '[') {
    return parse_event_array(text);
  }
  if (common::json_is_object(text)) {
    return common::Result<AgentReply>::success(reply_from_object(text));
  }

  std::vector<std::string> lines;
  std::istringstream stream(text);
  std::string line;
  while (std::getline(stream, line)) {
    lines.push_back(line);
  }
  for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
    if (common::json_is_object(*it)) {
      return common::Result<AgentReply>::success(reply_from_object(*it));
    }
  }
  return common::Result<AgentReply>::failure("agent output is not JSON");
}

} // namespace hermit::agent
