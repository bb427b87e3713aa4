#include "hermit/cli/commands.hpp"

#include "hermit/common/fs.hpp"
#include "hermit/common/json_util.hpp"
#include "hermit/common/version.hpp"
#include "hermit/config/config.hpp"
#include "hermit/daemon/daemon.hpp"
#include "hermit/gateway/client.hpp"
#include "hermit/gateway/protocol.hpp"
#include "hermit/runtime/app.hpp"

#include <csignal>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace hermit::cli {

namespace {

constexpr std::size_t PREVIEW_CHARS = 60;
constexpr std::size_t REPL_HISTORY = 6;

std::string version_string() {
  std::string version = "hermit " + common::version_number();
#ifdef HERMIT_GIT_COMMIT
  const std::string commit = HERMIT_GIT_COMMIT;
  if (!commit.empty() && commit != "unknown") {
    version += " (" + commit + ")";
  }
#endif
  return version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::string join_tokens(const std::vector<std::string> &args, const std::size_t begin = 0) {
  std::ostringstream out;
  for (std::size_t i = begin; i < args.size(); ++i) {
    if (i > begin) {
      out << ' ';
    }
    out << args[i];
  }
  return out.str();
}

std::string take_group(std::vector<std::string> &args) {
  std::string group = gateway::DEFAULT_GROUP;
  (void)take_option(args, "--group", "-g", group);
  return group;
}

std::string preview(const std::string &text) {
  if (text.size() <= PREVIEW_CHARS) {
    return text;
  }
  return text.substr(0, PREVIEW_CHARS) + "...";
}

std::optional<gateway::IpcClient> make_client() {
  auto context = runtime::RuntimeContext::from_disk();
  if (!context.ok()) {
    std::cerr << context.error() << "\n";
    return std::nullopt;
  }
  return gateway::IpcClient(context.value().config().daemon.socket_path);
}

/// Sends `request`; prints the error and returns nullopt on any failure.
std::optional<gateway::ClientResponse> call_daemon(const gateway::Request &request) {
  auto client = make_client();
  if (!client.has_value()) {
    return std::nullopt;
  }
  auto response = client->call(request);
  if (!response.ok()) {
    std::cerr << "Error: " << response.error() << "\n";
    return std::nullopt;
  }
  if (!response.value().ok) {
    std::cerr << "Error [" << response.value().code << "]: " << response.value().error << "\n";
    return std::nullopt;
  }
  return response.value();
}

int run_daemon(std::vector<std::string> args) {
  daemon::DaemonOptions options;
  options.force = take_flag(args, "--force");
  auto context = runtime::RuntimeContext::from_disk();
  if (!context.ok()) {
    std::cerr << context.error() << "\n";
    return 1;
  }
  context.value().install_observer();
  return daemon::run_daemon(context.value().config(), options);
}

int run_send(std::vector<std::string> args) {
  const std::string group = take_group(args);
  const std::string prompt = common::trim(join_tokens(args));
  if (prompt.empty()) {
    std::cerr << "Error: No prompt provided\n";
    return 1;
  }
  auto response = call_daemon(gateway::SendMessage{.group = group, .prompt = prompt});
  if (!response.has_value()) {
    return 1;
  }
  std::cout << response->field("result") << "\n";
  return 0;
}

void print_history(const std::string &history_json) {
  for (const auto &raw : common::json_split_top_level_objects(history_json)) {
    const auto entry = common::json_parse_flat(raw);
    const auto role = entry.find("role");
    const auto content = entry.find("content");
    if (role == entry.end() || content == entry.end()) {
      continue;
    }
    std::cout << (role->second == "user" ? "> " : "  ") << preview(content->second) << "\n";
  }
}

int run_repl(std::vector<std::string> args) {
  const std::string group = take_group(args);
  auto client = make_client();
  if (!client.has_value()) {
    return 1;
  }
  auto opened = client->call(gateway::StartInteractive{.group = group, .history = REPL_HISTORY});
  if (!opened.ok()) {
    std::cerr << "Error: " << opened.error() << "\n";
    return 1;
  }
  if (!opened.value().ok) {
    std::cerr << "Error [" << opened.value().code << "]: " << opened.value().error << "\n";
    return 1;
  }

  std::cout << "Hermit - chatting in group '" << group << "'\n";
  const std::string session = opened.value().field("session_id");
  std::cout << (session.empty() ? "New session" : "Resuming session " + session) << "\n";
  print_history(opened.value().field("history", "[]"));
  std::cout << "Type 'exit' or Ctrl+D to quit, '/new' to start a fresh session\n\n";

  std::string line;
  while (true) {
    std::cout << "> " << std::flush;
    if (!std::getline(std::cin, line)) {
      std::cout << "\nGoodbye!\n";
      break;
    }
    const std::string prompt = common::trim(line);
    if (prompt.empty()) {
      continue;
    }
    if (common::to_lower(prompt) == "exit") {
      break;
    }
    if (common::to_lower(prompt) == "/new") {
      auto cleared = client->call(gateway::ClearSession{.group = group});
      if (cleared.ok() && cleared.value().ok) {
        std::cout << "Session cleared.\n\n";
      } else {
        std::cout << "Error: "
                  << (cleared.ok() ? cleared.value().error : cleared.error()) << "\n\n";
      }
      continue;
    }
    auto response = client->call(gateway::SendMessage{.group = group, .prompt = prompt});
    if (!response.ok()) {
      std::cout << "Error: " << response.error() << "\n\n";
    } else if (!response.value().ok) {
      std::cout << "Error [" << response.value().code << "]: " << response.value().error
                << "\n\n";
    } else {
      std::cout << "\n" << response.value().field("result") << "\n\n";
    }
  }
  return 0;
}

int run_groups() {
  auto response = call_daemon(gateway::ListWorkspaces{});
  if (!response.has_value()) {
    return 1;
  }
  const auto groups = common::json_split_top_level_objects(response->field("groups", "[]"));
  if (groups.empty()) {
    std::cout << "No groups yet.\n";
    return 0;
  }
  for (const auto &raw : groups) {
    const auto group = common::json_parse_flat(raw);
    const auto session = group.find("session_id");
    const bool active = session != group.end();
    const auto name = group.find("name");
    const auto tasks = group.find("active_tasks");
    if (name == group.end()) {
      continue;
    }
    std::cout << "  " << name->second << ": session=" << (active ? "active" : "none")
              << " tasks=" << (tasks == group.end() ? "0" : tasks->second) << "\n";
  }
  return 0;
}

int run_new(std::vector<std::string> args) {
  const std::string group = take_group(args);
  auto response = call_daemon(gateway::ClearSession{.group = group});
  if (!response.has_value()) {
    return 1;
  }
  std::cout << response->field("message") << "\n";
  return 0;
}

int run_status() {
  auto client = make_client();
  if (!client.has_value()) {
    return 1;
  }
  auto response = client->call(gateway::DaemonStatus{});
  if (!response.ok() || !response.value().ok) {
    std::cout << "Daemon: not running\n";
    std::cout << "  Start with: hermit daemon\n";
    return 1;
  }
  std::cout << "Daemon: running (version " << response.value().field("version") << ")\n";
  std::cout << "  Uptime: " << response.value().field("uptime_seconds", "0") << "s\n";
  std::cout << "  Active invocations: " << response.value().field("active_invocations", "0")
            << "\n";
  const auto components = common::json_parse_flat(response.value().field("components", "{}"));
  for (const auto &[name, raw] : components) {
    const auto fields = common::json_parse_flat(raw);
    const auto status = fields.find("status");
    std::cout << "  " << name << ": " << (status == fields.end() ? "unknown" : status->second)
              << "\n";
  }
  return 0;
}

int run_task(std::vector<std::string> args) {
  if (args.empty()) {
    std::cerr << "usage: hermit task <add|list|rm>\n";
    return 1;
  }
  const std::string action = args[0];
  args.erase(args.begin());

  if (action == "add") {
    const std::string group = take_group(args);
    std::string cron;
    if (!take_option(args, "--cron", "-c", cron)) {
      std::cerr << "usage: hermit task add [-g GROUP] -c SCHEDULE PROMPT...\n";
      return 1;
    }
    const std::string prompt = common::trim(join_tokens(args));
    if (prompt.empty()) {
      std::cerr << "Error: No prompt provided\n";
      return 1;
    }
    auto response =
        call_daemon(gateway::AddTask{.group = group, .cron = cron, .prompt = prompt});
    if (!response.has_value()) {
      return 1;
    }
    std::cout << "Task " << response->field("task_id")
              << " created. Next run: " << response->field("next_run_local") << "\n";
    return 0;
  }

  if (action == "list") {
    gateway::ListTasks request;
    std::string group;
    if (take_option(args, "--group", "-g", group)) {
      request.group = group;
    }
    auto response = call_daemon(request);
    if (!response.has_value()) {
      return 1;
    }
    const auto tasks = common::json_split_top_level_objects(response->field("tasks", "[]"));
    if (tasks.empty()) {
      std::cout << "No scheduled tasks.\n";
      return 0;
    }
    for (const auto &raw : tasks) {
      const auto task = common::json_parse_flat(raw);
      const auto field = [&task](const std::string &key) {
        const auto it = task.find(key);
        return it == task.end() ? std::string() : it->second;
      };
      std::cout << "  [" << field("id") << "] " << field("group_name") << " | " << field("cron")
                << " | " << field("status") << "\n";
      std::cout << "      Prompt: " << preview(field("prompt")) << "\n";
      if (!field("next_run").empty()) {
        std::cout << "      Next: " << field("next_run") << "\n";
      }
      if (!field("last_result").empty()) {
        std::cout << "      Last: " << preview(field("last_result")) << "\n";
      }
      std::cout << "\n";
    }
    return 0;
  }

  if (action == "rm") {
    if (args.empty()) {
      std::cerr << "usage: hermit task rm TASK_ID\n";
      return 1;
    }
    auto response = call_daemon(gateway::RemoveTask{.task_id = args[0]});
    if (!response.has_value()) {
      return 1;
    }
    std::cout << response->field("message") << "\n";
    return 0;
  }

  std::cerr << "unknown task action: " << action << "\n";
  return 1;
}

int run_init(std::vector<std::string> args) {
  const bool force = take_flag(args, "--force");
  auto path = config::config_path();
  if (!path.ok()) {
    std::cerr << path.error() << "\n";
    return 1;
  }
  if (config::config_exists() && !force) {
    std::cout << "Config already exists at " << path.value().string()
              << " (use --force to overwrite)\n";
    return 0;
  }
  auto saved = config::save_config(config::Config{});
  if (!saved.ok()) {
    std::cerr << saved.error() << "\n";
    return 1;
  }
  auto context = runtime::RuntimeContext::from_disk();
  if (!context.ok()) {
    std::cerr << context.error() << "\n";
    return 1;
  }
  auto layout = context.value().ensure_layout();
  if (!layout.ok()) {
    std::cerr << layout.error() << "\n";
    return 1;
  }
  std::cout << "Wrote " << path.value().string() << "\n";
  return 0;
}

void print_help() {
  std::cout << version_string() << " - sandboxed coding agent daemon\n\n";
  std::cout << "Usage: hermit [--config PATH] <command> [options]\n\n";
  std::cout << "  daemon [--force]                 Run the daemon in the foreground\n";
  std::cout << "  send [-g GROUP] MESSAGE...       Send one message and print the reply\n";
  std::cout << "  repl [-g GROUP]                  Interactive chat\n";
  std::cout << "  groups                           List groups and their sessions\n";
  std::cout << "  new [-g GROUP]                   Start a fresh session\n";
  std::cout << "  status                           Daemon status\n";
  std::cout << "  task add [-g GROUP] -c SCHEDULE MESSAGE...\n";
  std::cout << "                                   SCHEDULE: @hourly, @daily, @weekly, */N,\n";
  std::cout << "                                   once:+Nm, once:YYYY-MM-DDTHH:MM\n";
  std::cout << "  task list [-g GROUP]             List scheduled tasks\n";
  std::cout << "  task rm TASK_ID                  Remove a task\n";
  std::cout << "  init [--force]                   Write a default config file\n";
  std::cout << "  config-path                      Print the config file location\n";
  std::cout << "  version                          Show version\n";
}

} // namespace

int run_cli(int argc, char **argv) {
  std::signal(SIGPIPE, SIG_IGN);
  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }
  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "config-path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      std::cerr << path_result.error() << "\n";
      return 1;
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }
  if (subcommand == "init") {
    return run_init(std::move(args));
  }
  if (subcommand == "daemon") {
    return run_daemon(std::move(args));
  }
  if (subcommand == "send") {
    return run_send(std::move(args));
  }
  if (subcommand == "repl") {
    return run_repl(std::move(args));
  }
  if (subcommand == "groups") {
    return run_groups();
  }
  if (subcommand == "new") {
    return run_new(std::move(args));
  }
  if (subcommand == "status") {
    return run_status();
  }
  if (subcommand == "task") {
    return run_task(std::move(args));
  }

  std::cerr << "unknown command: " << subcommand << "\n\n";
  print_help();
  return 1;
}

} // namespace hermit::cli
