#include "hermit/gateway/protocol.hpp"

#include "hermit/common/fs.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <type_traits>

namespace hermit::gateway {

namespace {

std::string field_or(const common::JsonFlatMap &fields, const std::string &key,
                     const std::string &fallback) {
  const auto it = fields.find(key);
  if (it == fields.end()) {
    return fallback;
  }
  return it->second;
}

std::string group_field(const common::JsonFlatMap &fields) {
  const std::string group = common::trim(field_or(fields, "group", ""));
  return group.empty() ? DEFAULT_GROUP : group;
}

common::Result<std::size_t> parse_limit(const std::string &raw) {
  const std::string value = common::trim(raw);
  if (value.empty() || value.size() > 6 ||
      !std::all_of(value.begin(), value.end(),
                   [](const unsigned char ch) { return std::isdigit(ch) != 0; })) {
    return common::Result<std::size_t>::failure("history must be a non-negative integer");
  }
  return common::Result<std::size_t>::success(static_cast<std::size_t>(std::stoul(value)));
}

std::string object_json(const std::vector<std::pair<std::string, std::string>> &fields) {
  std::ostringstream out;
  out << "{";
  bool first = true;
  for (const auto &[key, value] : fields) {
    if (!first) {
      out << ",";
    }
    first = false;
    out << common::json_quote(key) << ":" << value;
  }
  out << "}";
  return out.str();
}

} // namespace

std::string error_code_to_string(const ErrorCode code) {
  switch (code) {
  case ErrorCode::Ok:
    return "ok";
  case ErrorCode::InvalidRequest:
    return "invalid_request";
  case ErrorCode::UnknownCommand:
    return "unknown_command";
  case ErrorCode::InvalidWorkspace:
    return "invalid_workspace";
  case ErrorCode::InvalidTrigger:
    return "invalid_trigger";
  case ErrorCode::NotFound:
    return "not_found";
  case ErrorCode::Busy:
    return "busy";
  case ErrorCode::InvocationFailed:
    return "invocation_failed";
  case ErrorCode::Timeout:
    return "timeout";
  case ErrorCode::StoreError:
    return "store_error";
  case ErrorCode::InternalError:
    return "internal_error";
  }
  return "internal_error";
}

std::string command_name(const Request &request) {
  return std::visit(
      [](auto &&req) -> std::string {
        using T = std::decay_t<decltype(req)>;
        if constexpr (std::is_same_v<T, SendMessage>) {
          return "send";
        } else if constexpr (std::is_same_v<T, StartInteractive>) {
          return "interactive";
        } else if constexpr (std::is_same_v<T, ListWorkspaces>) {
          return "groups";
        } else if constexpr (std::is_same_v<T, ClearSession>) {
          return "new_session";
        } else if constexpr (std::is_same_v<T, DaemonStatus>) {
          return "status";
        } else if constexpr (std::is_same_v<T, AddTask>) {
          return "task_add";
        } else if constexpr (std::is_same_v<T, ListTasks>) {
          return "task_list";
        } else {
          static_assert(std::is_same_v<T, RemoveTask>);
          return "task_rm";
        }
      },
      request);
}

common::Result<Request> decode_request(const std::string &line, ErrorCode &error_code) {
  error_code = ErrorCode::InvalidRequest;
  if (line.size() > MAX_REQUEST_BYTES) {
    return common::Result<Request>::failure("request too large");
  }
  if (!common::json_is_object(line)) {
    return common::Result<Request>::failure("request is not a JSON object");
  }
  const auto fields = common::json_parse_flat(line);
  const std::string cmd = common::trim(field_or(fields, "cmd", ""));
  if (cmd.empty()) {
    return common::Result<Request>::failure("missing 'cmd'");
  }

  if (cmd == "send") {
    return common::Result<Request>::success(
        SendMessage{.group = group_field(fields), .prompt = field_or(fields, "prompt", "")});
  }
  if (cmd == "interactive") {
    StartInteractive request{.group = group_field(fields)};
    if (fields.contains("history")) {
      auto limit = parse_limit(field_or(fields, "history", ""));
      if (!limit.ok()) {
        return common::Result<Request>::failure(limit.error());
      }
      request.history = limit.value();
    }
    return common::Result<Request>::success(request);
  }
  if (cmd == "groups") {
    return common::Result<Request>::success(ListWorkspaces{});
  }
  if (cmd == "new_session") {
    return common::Result<Request>::success(ClearSession{.group = group_field(fields)});
  }
  if (cmd == "status" || cmd == "ping") {
    return common::Result<Request>::success(DaemonStatus{});
  }
  if (cmd == "task_add") {
    return common::Result<Request>::success(AddTask{.group = group_field(fields),
                                                    .cron = field_or(fields, "cron", ""),
                                                    .prompt = field_or(fields, "prompt", "")});
  }
  if (cmd == "task_list") {
    ListTasks request;
    const std::string group = common::trim(field_or(fields, "group", ""));
    if (!group.empty()) {
      request.group = group;
    }
    return common::Result<Request>::success(request);
  }
  if (cmd == "task_rm") {
    return common::Result<Request>::success(
        RemoveTask{.task_id = common::trim(field_or(fields, "task_id", ""))});
  }

  error_code = ErrorCode::UnknownCommand;
  return common::Result<Request>::failure("unknown command: " + cmd);
}

std::string encode_request(const Request &request) {
  std::vector<std::pair<std::string, std::string>> fields;
  fields.emplace_back("cmd", common::json_quote(command_name(request)));
  std::visit(
      [&fields](auto &&req) {
        using T = std::decay_t<decltype(req)>;
        if constexpr (std::is_same_v<T, SendMessage>) {
          fields.emplace_back("group", common::json_quote(req.group));
          fields.emplace_back("prompt", common::json_quote(req.prompt));
        } else if constexpr (std::is_same_v<T, StartInteractive>) {
          fields.emplace_back("group", common::json_quote(req.group));
          fields.emplace_back("history", std::to_string(req.history));
        } else if constexpr (std::is_same_v<T, ClearSession>) {
          fields.emplace_back("group", common::json_quote(req.group));
        } else if constexpr (std::is_same_v<T, AddTask>) {
          fields.emplace_back("group", common::json_quote(req.group));
          fields.emplace_back("cron", common::json_quote(req.cron));
          fields.emplace_back("prompt", common::json_quote(req.prompt));
        } else if constexpr (std::is_same_v<T, ListTasks>) {
          if (req.group.has_value()) {
            fields.emplace_back("group", common::json_quote(*req.group));
          }
        } else if constexpr (std::is_same_v<T, RemoveTask>) {
          fields.emplace_back("task_id", common::json_quote(req.task_id));
        }
      },
      request);
  return object_json(fields);
}

Response Response::ok() { return Response{}; }

Response Response::failure(const ErrorCode code, std::string message) {
  Response response;
  response.code_ = code;
  response.error_ = std::move(message);
  return response;
}

Response &Response::set_string(const std::string &key, const std::string &value) {
  return set_raw(key, common::json_quote(value));
}

Response &Response::set_raw(const std::string &key, std::string json) {
  for (auto &[existing, value] : fields_) {
    if (existing == key) {
      value = std::move(json);
      return *this;
    }
  }
  fields_.emplace_back(key, std::move(json));
  return *this;
}

std::string Response::to_json() const {
  std::vector<std::pair<std::string, std::string>> fields;
  fields.emplace_back("status", common::json_quote(is_ok() ? "ok" : "error"));
  fields.emplace_back("code", common::json_quote(error_code_to_string(code_)));
  if (!is_ok()) {
    fields.emplace_back("error", common::json_quote(error_));
  }
  fields.insert(fields.end(), fields_.begin(), fields_.end());
  return object_json(fields);
}

std::string ClientResponse::field(const std::string &key, const std::string &fallback) const {
  return field_or(fields, key, fallback);
}

common::Result<ClientResponse> decode_response(const std::string &line) {
  if (!common::json_is_object(line)) {
    return common::Result<ClientResponse>::failure("daemon response is not a JSON object");
  }
  ClientResponse response;
  response.fields = common::json_parse_flat(line);
  response.ok = field_or(response.fields, "status", "") == "ok";
  response.code = field_or(response.fields, "code", response.ok ? "ok" : "internal_error");
  response.error = field_or(response.fields, "error", "");
  return common::Result<ClientResponse>::success(std::move(response));
}

} // namespace hermit::gateway
