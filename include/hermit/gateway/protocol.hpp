#pragma once

#include "hermit/common/json_util.hpp"
#include "hermit/common/result.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace hermit::gateway {

inline constexpr const char *DEFAULT_GROUP = "default";
inline constexpr std::size_t DEFAULT_HISTORY_LIMIT = 20;
inline constexpr std::size_t MAX_REQUEST_BYTES = 1024 * 1024;

/// Stable wire codes carried in every response's `code` field.
enum class ErrorCode {
  Ok,
  InvalidRequest,
  UnknownCommand,
  InvalidWorkspace,
  InvalidTrigger,
  NotFound,
  Busy,
  InvocationFailed,
  Timeout,
  StoreError,
  InternalError,
};

[[nodiscard]] std::string error_code_to_string(ErrorCode code);

struct SendMessage {
  std::string group = DEFAULT_GROUP;
  std::string prompt;
};

struct StartInteractive {
  std::string group = DEFAULT_GROUP;
  std::size_t history = DEFAULT_HISTORY_LIMIT;
};

struct ListWorkspaces {};

struct ClearSession {
  std::string group = DEFAULT_GROUP;
};

struct DaemonStatus {};

struct AddTask {
  std::string group = DEFAULT_GROUP;
  std::string cron;
  std::string prompt;
};

struct ListTasks {
  std::optional<std::string> group;
};

struct RemoveTask {
  std::string task_id;
};

using Request = std::variant<SendMessage, StartInteractive, ListWorkspaces, ClearSession,
                             DaemonStatus, AddTask, ListTasks, RemoveTask>;

/// Wire `cmd` name of a request.
[[nodiscard]] std::string command_name(const Request &request);

/// Decodes one request line. On failure `error_code` is InvalidRequest or
/// UnknownCommand.
[[nodiscard]] common::Result<Request> decode_request(const std::string &line,
                                                     ErrorCode &error_code);
[[nodiscard]] std::string encode_request(const Request &request);

/// Server-side response builder. Field values are raw JSON text.
class Response {
public:
  [[nodiscard]] static Response ok();
  [[nodiscard]] static Response failure(ErrorCode code, std::string message);

  Response &set_string(const std::string &key, const std::string &value);
  Response &set_raw(const std::string &key, std::string json);

  [[nodiscard]] bool is_ok() const { return code_ == ErrorCode::Ok; }
  [[nodiscard]] ErrorCode code() const { return code_; }
  [[nodiscard]] const std::string &error() const { return error_; }
  [[nodiscard]] std::string to_json() const;

private:
  ErrorCode code_ = ErrorCode::Ok;
  std::string error_;
  std::vector<std::pair<std::string, std::string>> fields_;
};

/// Client-side view of a response line.
struct ClientResponse {
  bool ok = false;
  std::string code;
  std::string error;
  common::JsonFlatMap fields;

  [[nodiscard]] std::string field(const std::string &key, const std::string &fallback = "") const;
};

[[nodiscard]] common::Result<ClientResponse> decode_response(const std::string &line);

} // namespace hermit::gateway
