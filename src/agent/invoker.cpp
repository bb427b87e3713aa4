#include "hermit/agent/invoker.hpp"

#include "hermit/common/fs.hpp"
#include "hermit/observability/global.hpp"
#include "hermit/sandbox/policy.hpp"
#include "hermit/store/transcript.hpp"

#include <iostream>
#include <map>

namespace hermit::agent {

namespace {

constexpr std::size_t MAX_STDERR_IN_MESSAGE = 400;

InvokeResult failed(const InvokeFailureKind kind, std::string message) {
  return InvokeResult{.output = std::nullopt,
                      .failure = InvokeFailure{.kind = kind, .message = std::move(message)}};
}

std::string stderr_tail(const std::string &text) {
  std::string tail = common::trim(text);
  if (tail.size() > MAX_STDERR_IN_MESSAGE) {
    tail = "..." + tail.substr(tail.size() - MAX_STDERR_IN_MESSAGE);
  }
  return tail;
}

void log_transcript_error(const store::Workspace &workspace, const common::Status &status) {
  if (!status.ok()) {
    std::cerr << "[agent] transcript append failed workspace=" << workspace.name
              << " error=" << status.error() << "\n";
  }
}

} // namespace

AgentInvoker::AgentInvoker(const config::Config &config, sandbox::IProcessRunner &runner)
    : config_(config), runner_(runner) {}

std::vector<std::string>
AgentInvoker::agent_command(const std::string &prompt,
                            const std::optional<std::string> &resume_session) const {
  std::vector<std::string> command;
  command.push_back(config_.agent.command);
  command.insert(command.end(), config_.agent.args.begin(), config_.agent.args.end());
  if (resume_session.has_value() && !resume_session->empty() &&
      !config_.agent.resume_flag.empty()) {
    command.push_back(config_.agent.resume_flag);
    command.push_back(*resume_session);
  }
  if (!config_.agent.prompt_via_stdin) {
    command.push_back(prompt);
  }
  return command;
}

InvokeResult AgentInvoker::invoke(const store::Workspace &workspace, const std::string &prompt,
                                  const std::optional<std::string> &resume_session,
                                  const TurnContext &context) {
  std::map<std::string, std::string> metadata{{"origin", context.origin}};
  if (!context.task_id.empty()) {
    metadata["task_id"] = context.task_id;
  }
  const auto history = store::transcript_path(workspace);
  log_transcript_error(workspace,
                       store::append_transcript(history, store::TranscriptEntry{
                                                             .role = store::TranscriptRole::User,
                                                             .content = prompt,
                                                             .timestamp = "",
                                                             .metadata = metadata,
                                                         }));

  observability::record_invocation_start(workspace.name, resume_session.has_value(),
                                         context.origin);
  observability::record_metric(observability::ActiveInvocationsMetric{.count = ++active_});
  InvokeResult result = run_sandboxed(workspace, prompt, resume_session);
  observability::record_metric(observability::ActiveInvocationsMetric{.count = --active_});

  const bool timed_out = !result.ok() && result.failure.kind == InvokeFailureKind::Timeout;
  observability::record_invocation_end(
      workspace.name, result.ok() ? result.output->duration : std::chrono::milliseconds(0),
      result.ok(), timed_out);

  if (result.ok()) {
    metadata["session_id"] = result.output->session_id;
    log_transcript_error(workspace, store::append_transcript(
                                        history, store::TranscriptEntry{
                                                     .role = store::TranscriptRole::Assistant,
                                                     .content = result.output->reply,
                                                     .timestamp = "",
                                                     .metadata = metadata,
                                                 }));
  } else {
    metadata["failure"] = invoke_failure_kind_to_string(result.failure.kind);
    log_transcript_error(workspace, store::append_transcript(
                                        history, store::TranscriptEntry{
                                                     .role = store::TranscriptRole::System,
                                                     .content = result.failure.message,
                                                     .timestamp = "",
                                                     .metadata = metadata,
                                                 }));
  }
  return result;
}

InvokeResult AgentInvoker::run_sandboxed(const store::Workspace &workspace,
                                         const std::string &prompt,
                                         const std::optional<std::string> &resume_session) {
  auto seeded = sandbox::seed_agent_config(config_);
  if (!seeded.ok()) {
    return failed(InvokeFailureKind::Helper, "agent config setup failed: " + seeded.error());
  }

  auto plan = sandbox::compile_plan(workspace, config_);
  if (!plan.ok()) {
    return failed(InvokeFailureKind::Helper, "sandbox policy: " + plan.error());
  }
  for (const auto &warning : plan.value().warnings) {
    std::cerr << "[sandbox] " << workspace.name << ": " << warning << "\n";
  }

  const auto argv = sandbox::build_helper_args(config_.sandbox.helper, plan.value(),
                                               agent_command(prompt, resume_session));
  sandbox::ProcessOptions options;
  options.timeout = std::chrono::milliseconds(config_.agent.timeout_secs * 1000);
  options.env = plan.value().env;
  if (config_.agent.prompt_via_stdin) {
    options.stdin_text = prompt;
  }

  auto run = runner_.run(argv, options);
  if (!run.ok()) {
    return failed(InvokeFailureKind::Helper, "failed to start sandbox helper: " + run.error());
  }
  const auto &process = run.value();
  if (process.timed_out) {
    return failed(InvokeFailureKind::Timeout, "agent timed out after " +
                                                  std::to_string(config_.agent.timeout_secs) +
                                                  "s");
  }

  auto parsed = parse_agent_output(process.stdout_text);
  if (process.exit_code != 0) {
    if (parsed.ok() && parsed.value().is_error && !parsed.value().result.empty()) {
      return failed(InvokeFailureKind::AgentError, parsed.value().result);
    }
    std::string message = "agent exited with code " + std::to_string(process.exit_code);
    const auto tail = stderr_tail(process.stderr_text);
    if (!tail.empty()) {
      message += ": " + tail;
    }
    return failed(InvokeFailureKind::Helper, message);
  }
  if (!parsed.ok()) {
    return failed(InvokeFailureKind::Malformed, parsed.error());
  }
  if (parsed.value().is_error) {
    return failed(InvokeFailureKind::AgentError, parsed.value().result.empty()
                                                     ? "agent reported an error"
                                                     : parsed.value().result);
  }
  if (parsed.value().session_id.empty()) {
    return failed(InvokeFailureKind::Malformed, "agent output has no session_id");
  }

  return InvokeResult{.output = InvocationOutput{.reply = parsed.value().result,
                                                 .session_id = parsed.value().session_id,
                                                 .duration = process.duration},
                      .failure = {}};
}

} // namespace hermit::agent
