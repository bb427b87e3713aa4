#include "hermit/gateway/handler.hpp"

#include "hermit/common/fs.hpp"
#include "hermit/common/time.hpp"
#include "hermit/common/version.hpp"
#include "hermit/health/health.hpp"
#include "hermit/observability/global.hpp"
#include "hermit/scheduler/trigger.hpp"
#include "hermit/store/transcript.hpp"

#include <iostream>
#include <sstream>

namespace hermit::gateway {

namespace {

std::string json_array(const std::vector<std::string> &objects) {
  std::ostringstream out;
  out << "[";
  for (std::size_t i = 0; i < objects.size(); ++i) {
    if (i > 0) {
      out << ",";
    }
    out << objects[i];
  }
  out << "]";
  return out.str();
}

std::string optional_string(const std::optional<std::string> &value) {
  return value.has_value() ? common::json_quote(*value) : "null";
}

std::string workspace_json(const store::WorkspaceSummary &summary) {
  std::ostringstream out;
  out << "{\"name\":" << common::json_quote(summary.workspace.name)
      << ",\"folder\":" << common::json_quote(summary.workspace.folder)
      << ",\"created_at\":" << common::json_quote(summary.workspace.created_at)
      << ",\"session_id\":"
      << optional_string(summary.session.has_value()
                             ? std::optional<std::string>(summary.session->id)
                             : std::nullopt)
      << ",\"session_updated_at\":"
      << optional_string(summary.session.has_value()
                             ? std::optional<std::string>(summary.session->updated_at)
                             : std::nullopt)
      << ",\"active_tasks\":" << summary.active_tasks << "}";
  return out.str();
}

std::string task_json(const store::Task &task) {
  std::ostringstream out;
  out << "{\"id\":" << common::json_quote(task.id)
      << ",\"group_name\":" << common::json_quote(task.workspace)
      << ",\"cron\":" << common::json_quote(task.trigger)
      << ",\"prompt\":" << common::json_quote(task.prompt)
      << ",\"status\":" << common::json_quote(store::task_status_to_string(task.status));
  if (task.status == store::TaskStatus::Active) {
    out << ",\"next_run\":" << common::json_quote(common::to_rfc3339(task.next_run));
  } else {
    out << ",\"next_run\":null";
  }
  out << ",\"last_run\":"
      << optional_string(task.last_run.has_value()
                             ? std::optional<std::string>(common::to_rfc3339(*task.last_run))
                             : std::nullopt)
      << ",\"last_result\":"
      << (task.last_result.empty() ? "null" : common::json_quote(task.last_result))
      << ",\"created_at\":" << common::json_quote(task.created_at) << "}";
  return out.str();
}

std::string transcript_json(const store::TranscriptEntry &entry) {
  std::ostringstream out;
  out << "{\"role\":" << common::json_quote(store::role_to_string(entry.role))
      << ",\"content\":" << common::json_quote(entry.content)
      << ",\"timestamp\":" << common::json_quote(entry.timestamp) << "}";
  return out.str();
}

} // namespace

ErrorCode error_code_for(const agent::TurnStatus status) {
  switch (status) {
  case agent::TurnStatus::Ok:
    return ErrorCode::Ok;
  case agent::TurnStatus::Busy:
    return ErrorCode::Busy;
  case agent::TurnStatus::InvalidWorkspace:
    return ErrorCode::InvalidWorkspace;
  case agent::TurnStatus::InvocationFailed:
    return ErrorCode::InvocationFailed;
  case agent::TurnStatus::Timeout:
    return ErrorCode::Timeout;
  case agent::TurnStatus::StoreError:
    return ErrorCode::StoreError;
  }
  return ErrorCode::InternalError;
}

RequestHandler::RequestHandler(const config::Config &config, store::Store &store,
                               agent::SessionRunner &runner, const agent::AgentInvoker &invoker)
    : config_(config), store_(store), runner_(runner), invoker_(invoker),
      started_at_(std::chrono::steady_clock::now()) {}

Response RequestHandler::handle_line(const std::string &line) {
  const auto started = std::chrono::steady_clock::now();
  std::string command = "invalid";
  Response response = Response::failure(ErrorCode::InternalError, "request not handled");
  try {
    ErrorCode decode_error = ErrorCode::InvalidRequest;
    auto request = decode_request(common::trim(line), decode_error);
    if (!request.ok()) {
      response = Response::failure(decode_error, request.error());
    } else {
      command = command_name(request.value());
      response = dispatch(request.value());
    }
  } catch (const std::exception &ex) {
    observability::record_error("ipc", std::string("handler exception: ") + ex.what());
    response = Response::failure(ErrorCode::InternalError, ex.what());
  }
  observability::record_request(command, error_code_to_string(response.code()),
                                std::chrono::duration_cast<std::chrono::milliseconds>(
                                    std::chrono::steady_clock::now() - started));
  return response;
}

Response RequestHandler::dispatch(const Request &request) {
  return std::visit([this](const auto &req) { return handle(req); }, request);
}

agent::BusyPolicy RequestHandler::interactive_policy() const {
  auto policy = agent::parse_busy_policy(config_.daemon.interactive_busy_policy);
  return policy.ok() ? policy.value() : agent::BusyPolicy::Queue;
}

Response RequestHandler::handle(const SendMessage &request) {
  if (common::trim(request.prompt).empty()) {
    return Response::failure(ErrorCode::InvalidRequest, "No prompt provided");
  }
  const auto outcome = runner_.send(request.group, request.prompt,
                                    agent::TurnContext{.origin = "ipc"}, interactive_policy());
  if (!outcome.ok()) {
    Response response = Response::failure(error_code_for(outcome.status), outcome.message);
    if (!outcome.reply.empty()) {
      response.set_string("result", outcome.reply);
    }
    return response;
  }
  Response response = Response::ok();
  response.set_string("result", outcome.reply)
      .set_string("session_id", outcome.session_id)
      .set_string("group", request.group)
      .set_raw("resumed", outcome.resumed ? "true" : "false");
  return response;
}

Response RequestHandler::handle(const StartInteractive &request) {
  agent::TurnStatus failure = agent::TurnStatus::StoreError;
  auto workspace = runner_.resolve_workspace(request.group, failure);
  if (!workspace.ok()) {
    return Response::failure(error_code_for(failure), workspace.error());
  }
  auto session = store_.get_session(request.group);
  if (!session.ok()) {
    return Response::failure(ErrorCode::StoreError, session.error());
  }
  auto history = store::read_transcript_tail(store::transcript_path(workspace.value()),
                                             request.history);
  if (!history.ok()) {
    return Response::failure(ErrorCode::StoreError, history.error());
  }
  std::vector<std::string> entries;
  entries.reserve(history.value().size());
  for (const auto &entry : history.value()) {
    entries.push_back(transcript_json(entry));
  }

  Response response = Response::ok();
  response.set_string("group", workspace.value().name)
      .set_string("folder", workspace.value().folder)
      .set_raw("session_id", optional_string(session.value().has_value()
                                                 ? std::optional<std::string>(
                                                       session.value()->id)
                                                 : std::nullopt))
      .set_raw("history", json_array(entries));
  return response;
}

Response RequestHandler::handle(const ListWorkspaces &) {
  auto listed = store_.list_workspaces();
  if (!listed.ok()) {
    return Response::failure(ErrorCode::StoreError, listed.error());
  }
  std::vector<std::string> groups;
  groups.reserve(listed.value().size());
  for (const auto &summary : listed.value()) {
    groups.push_back(workspace_json(summary));
  }
  Response response = Response::ok();
  response.set_raw("groups", json_array(groups));
  return response;
}

Response RequestHandler::handle(const ClearSession &request) {
  auto valid = store::validate_workspace_name(request.group);
  if (!valid.ok()) {
    return Response::failure(ErrorCode::InvalidWorkspace, valid.error());
  }
  auto existing = store_.find_workspace(request.group);
  if (!existing.ok()) {
    return Response::failure(ErrorCode::StoreError, existing.error());
  }
  bool cleared = false;
  if (existing.value().has_value()) {
    auto result = store_.clear_session(request.group);
    if (!result.ok()) {
      return Response::failure(ErrorCode::StoreError, result.error());
    }
    cleared = result.value();
  }
  Response response = Response::ok();
  response.set_string("message", "Session cleared for " + request.group)
      .set_string("group", request.group)
      .set_raw("cleared", cleared ? "true" : "false");
  return response;
}

Response RequestHandler::handle(const DaemonStatus &) {
  const auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
                          std::chrono::steady_clock::now() - started_at_)
                          .count();
  Response response = Response::ok();
  response.set_string("message", "pong")
      .set_string("version", common::version_number())
      .set_raw("uptime_seconds", std::to_string(uptime))
      .set_raw("active_invocations", std::to_string(invoker_.active_invocations()))
      .set_string("socket", config_.daemon.socket_path)
      .set_raw("components", health::components_json());
  return response;
}

Response RequestHandler::handle(const AddTask &request) {
  if (common::trim(request.prompt).empty()) {
    return Response::failure(ErrorCode::InvalidRequest, "No prompt provided");
  }
  const auto now = common::Clock::now();
  auto trigger = scheduler::parse_trigger(request.cron, now);
  if (!trigger.ok()) {
    return Response::failure(ErrorCode::InvalidTrigger, trigger.error());
  }
  agent::TurnStatus failure = agent::TurnStatus::StoreError;
  auto workspace = runner_.resolve_workspace(request.group, failure);
  if (!workspace.ok()) {
    return Response::failure(error_code_for(failure), workspace.error());
  }

  const auto next_run = scheduler::first_run(trigger.value(), now);
  auto added = store_.add_task(store::NewTask{.workspace = workspace.value().name,
                                              .trigger = common::trim(request.cron),
                                              .prompt = request.prompt,
                                              .next_run = next_run});
  if (!added.ok()) {
    return Response::failure(ErrorCode::StoreError, added.error());
  }
  std::cerr << "[ipc] task " << added.value() << " added workspace=" << request.group
            << " trigger=" << request.cron << "\n";
  Response response = Response::ok();
  response.set_string("task_id", added.value())
      .set_string("group", workspace.value().name)
      .set_string("next_run", common::to_rfc3339(next_run))
      .set_string("next_run_local", common::format_local(next_run));
  return response;
}

Response RequestHandler::handle(const ListTasks &request) {
  auto listed = store_.list_tasks(request.group);
  if (!listed.ok()) {
    return Response::failure(ErrorCode::StoreError, listed.error());
  }
  std::vector<std::string> tasks;
  tasks.reserve(listed.value().size());
  for (const auto &task : listed.value()) {
    tasks.push_back(task_json(task));
  }
  Response response = Response::ok();
  response.set_raw("tasks", json_array(tasks));
  return response;
}

Response RequestHandler::handle(const RemoveTask &request) {
  if (request.task_id.empty()) {
    return Response::failure(ErrorCode::InvalidRequest, "No task_id provided");
  }
  auto deleted = store_.delete_task(request.task_id);
  if (!deleted.ok()) {
    return Response::failure(ErrorCode::StoreError, deleted.error());
  }
  if (!deleted.value()) {
    return Response::failure(ErrorCode::NotFound, "Task " + request.task_id + " not found");
  }
  Response response = Response::ok();
  response.set_string("message", "Task " + request.task_id + " deleted");
  return response;
}

} // namespace hermit::gateway
