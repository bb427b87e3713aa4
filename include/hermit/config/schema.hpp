#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace hermit::config {

/// Filesystem layout. Empty entries are filled relative to the hermit home
/// directory when the config is loaded.
struct PathsConfig {
  std::string home;
  std::string groups_dir;
  std::string data_dir;
  std::string tools_dir;
  std::string tool_config_dir;
};

struct DaemonConfig {
  std::string socket_path;
  std::string pid_path;
  std::string state_path;
  std::uint64_t scheduler_poll_secs = 60;
  std::uint64_t state_write_secs = 30;
  std::uint32_t max_queue_depth = 8;
  std::uint64_t queue_wait_secs = 900;
  std::string interactive_busy_policy = "queue";
  std::string scheduled_busy_policy = "defer";
};

struct AgentConfig {
  std::string command = "claude";
  std::vector<std::string> args = {"-p", "--output-format", "json",
                                   "--dangerously-skip-permissions"};
  std::string resume_flag = "--resume";
  std::uint64_t timeout_secs = 300;
  std::string config_dir;
  std::string credentials_file = "~/.claude/.credentials.json";
  std::vector<std::string> binary_dirs = {"~/.local/bin", "~/.local/share/claude"};
  /// Prompt goes to the agent's stdin; otherwise it is the last argument.
  bool prompt_via_stdin = true;
};

struct SandboxConfig {
  std::string helper = "bwrap";
  bool share_net = true;
  bool require_tls = true;
  std::vector<std::string> system_ro_paths = {"/usr", "/lib", "/lib64", "/bin",
                                              "/etc/resolv.conf"};
  std::vector<std::string> cert_paths = {"/etc/ssl", "/etc/pki"};
  /// Host variables copied into the sandbox when set. Empty by default: the
  /// agent authenticates through the seeded credentials file.
  std::vector<std::string> env_passthrough;
};

/// One `[tools.<name>]` table. All fields are optional overrides of the
/// built-in tool catalog.
struct ToolConfig {
  std::string name;
  std::string env;
  std::string token;
  std::string token_file;
  bool network = true;
};

struct ToolsConfig {
  std::vector<std::string> enabled = {"gh"};
  std::vector<ToolConfig> entries;
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  PathsConfig paths;
  DaemonConfig daemon;
  AgentConfig agent;
  SandboxConfig sandbox;
  ToolsConfig tools;
  ObservabilityConfig observability;
};

} // namespace hermit::config
