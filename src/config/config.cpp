#include "hermit/config/config.hpp"

#include "hermit/common/fs.hpp"
#include "hermit/common/toml.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace hermit::config {

namespace {

constexpr const char *HOME_FOLDER = ".hermit";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return g_config_path_override;
  }
  if (const char *env = std::getenv("HERMIT_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string strip_env_quotes(const std::string &raw) {
  const std::string value = common::trim(raw);
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
      value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool is_valid_env_name(const std::string &name) {
  if (name.empty()) {
    return false;
  }
  if (!(std::isalpha(static_cast<unsigned char>(name.front())) != 0 || name.front() == '_')) {
    return false;
  }
  for (const char ch : name) {
    if (!(std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_')) {
      return false;
    }
  }
  return true;
}

void load_dotenv_file(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return;
  }
  std::ifstream file(path);
  if (!file) {
    return;
  }

  std::string line;
  while (std::getline(file, line)) {
    std::string trimmed = common::trim(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }
    if (common::starts_with(trimmed, "export ")) {
      trimmed = common::trim(trimmed.substr(7));
    }
    const auto eq = trimmed.find('=');
    if (eq == std::string::npos) {
      continue;
    }
    const std::string key = common::trim(trimmed.substr(0, eq));
    if (!is_valid_env_name(key)) {
      continue;
    }
    // Existing environment wins.
    setenv(key.c_str(), strip_env_quotes(trimmed.substr(eq + 1)).c_str(), 0);
  }
}

void load_dotenv_files() {
  if (const char *env_file = std::getenv("HERMIT_ENV_FILE");
      env_file != nullptr && *env_file != '\0') {
    load_dotenv_file(common::expand_path(env_file));
  }
  if (auto home = hermit_home(); home.ok()) {
    load_dotenv_file(home.value() / ".env");
  }
}

std::string bool_to_toml(bool value) { return value ? "true" : "false"; }

std::string expand_or_default(const std::string &value, const std::filesystem::path &fallback) {
  if (value.empty()) {
    return fallback.string();
  }
  return common::expand_path(value);
}

void load_tool_entries(Config &config, const common::TomlDocument &doc) {
  for (const auto &name : doc.subsections("tools")) {
    const std::string prefix = "tools." + name + ".";
    ToolConfig tool;
    tool.name = name;
    tool.env = doc.get_string(prefix + "env");
    tool.token = doc.get_string(prefix + "token");
    tool.token_file = doc.get_string(prefix + "token_file");
    tool.network = doc.get_bool(prefix + "network", tool.network);
    config.tools.entries.push_back(std::move(tool));
  }
}

} // namespace

common::Result<std::filesystem::path> hermit_home() {
  if (const char *env = std::getenv("HERMIT_HOME"); env != nullptr && *env != '\0') {
    return common::ensure_dir(common::expand_path(env));
  }
  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }
  return common::ensure_dir(home.value() / HOME_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec)) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto home = hermit_home();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  std::error_code ec;
  return path.ok() && std::filesystem::exists(path.value(), ec);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

void resolve_paths(Config &config, const std::filesystem::path &home) {
  auto &paths = config.paths;
  paths.home = expand_or_default(paths.home, home);
  const std::filesystem::path root(paths.home);
  paths.groups_dir = expand_or_default(paths.groups_dir, root / "groups");
  paths.data_dir = expand_or_default(paths.data_dir, root / "data");
  paths.tools_dir = expand_or_default(paths.tools_dir, root / "tools");
  paths.tool_config_dir = expand_or_default(paths.tool_config_dir, root / "config");

  const std::filesystem::path data(paths.data_dir);
  config.daemon.socket_path = expand_or_default(config.daemon.socket_path, data / "hermit.sock");
  config.daemon.pid_path = expand_or_default(config.daemon.pid_path, data / "hermit.pid");
  config.daemon.state_path =
      expand_or_default(config.daemon.state_path, data / "daemon_state.json");

  config.agent.config_dir = expand_or_default(config.agent.config_dir, root / ".claude");
  if (!config.agent.credentials_file.empty()) {
    config.agent.credentials_file = common::expand_path(config.agent.credentials_file);
  }
  for (auto &dir : config.agent.binary_dirs) {
    dir = common::expand_path(dir);
  }
  for (auto &tool : config.tools.entries) {
    if (!tool.token_file.empty()) {
      tool.token_file = common::expand_path(tool.token_file);
    }
  }
}

void apply_env_overrides(Config &config) {
  load_dotenv_files();

  if (const char *command = std::getenv("HERMIT_AGENT_COMMAND"); command != nullptr && *command) {
    config.agent.command = command;
  }
  if (const char *helper = std::getenv("HERMIT_SANDBOX_HELPER"); helper != nullptr && *helper) {
    config.sandbox.helper = helper;
  }
  if (const char *socket = std::getenv("HERMIT_SOCKET"); socket != nullptr && *socket) {
    config.daemon.socket_path = common::expand_path(socket);
  }
}

common::Result<Config> load_config() {
  load_dotenv_files();

  Config config;
  const auto home = hermit_home();
  if (!home.ok()) {
    return common::Result<Config>::failure(home.error());
  }
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error());
  }

  const auto path = cfg_path_result.value();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    apply_env_overrides(config);
    resolve_paths(config, home.value());
    return common::Result<Config>::success(std::move(config));
  }

  const auto content = common::read_file(path);
  if (!content.ok()) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string());
  }
  const auto parsed = common::parse_toml(content.value());
  if (!parsed.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + parsed.error());
  }
  const auto &doc = parsed.value();

  config.paths.home = doc.get_string("paths.home", config.paths.home);
  config.paths.groups_dir = doc.get_string("paths.groups_dir", config.paths.groups_dir);
  config.paths.data_dir = doc.get_string("paths.data_dir", config.paths.data_dir);
  config.paths.tools_dir = doc.get_string("paths.tools_dir", config.paths.tools_dir);
  config.paths.tool_config_dir =
      doc.get_string("paths.tool_config_dir", config.paths.tool_config_dir);

  config.daemon.socket_path = doc.get_string("daemon.socket_path", config.daemon.socket_path);
  config.daemon.pid_path = doc.get_string("daemon.pid_path", config.daemon.pid_path);
  config.daemon.state_path = doc.get_string("daemon.state_path", config.daemon.state_path);
  config.daemon.scheduler_poll_secs =
      doc.get_u64("daemon.scheduler_poll_secs", config.daemon.scheduler_poll_secs);
  config.daemon.state_write_secs =
      doc.get_u64("daemon.state_write_secs", config.daemon.state_write_secs);
  config.daemon.max_queue_depth = static_cast<std::uint32_t>(
      doc.get_u64("daemon.max_queue_depth", config.daemon.max_queue_depth));
  config.daemon.queue_wait_secs =
      doc.get_u64("daemon.queue_wait_secs", config.daemon.queue_wait_secs);
  config.daemon.interactive_busy_policy = common::to_lower(
      doc.get_string("daemon.interactive_busy_policy", config.daemon.interactive_busy_policy));
  config.daemon.scheduled_busy_policy = common::to_lower(
      doc.get_string("daemon.scheduled_busy_policy", config.daemon.scheduled_busy_policy));

  config.agent.command = doc.get_string("agent.command", config.agent.command);
  config.agent.args = doc.get_string_array("agent.args", config.agent.args);
  config.agent.resume_flag = doc.get_string("agent.resume_flag", config.agent.resume_flag);
  config.agent.timeout_secs = doc.get_u64("agent.timeout_secs", config.agent.timeout_secs);
  config.agent.config_dir = doc.get_string("agent.config_dir", config.agent.config_dir);
  config.agent.credentials_file =
      doc.get_string("agent.credentials_file", config.agent.credentials_file);
  config.agent.binary_dirs = doc.get_string_array("agent.binary_dirs", config.agent.binary_dirs);
  config.agent.prompt_via_stdin =
      doc.get_bool("agent.prompt_via_stdin", config.agent.prompt_via_stdin);

  config.sandbox.helper = doc.get_string("sandbox.helper", config.sandbox.helper);
  config.sandbox.share_net = doc.get_bool("sandbox.share_net", config.sandbox.share_net);
  config.sandbox.require_tls = doc.get_bool("sandbox.require_tls", config.sandbox.require_tls);
  config.sandbox.system_ro_paths =
      doc.get_string_array("sandbox.system_ro_paths", config.sandbox.system_ro_paths);
  config.sandbox.cert_paths = doc.get_string_array("sandbox.cert_paths", config.sandbox.cert_paths);
  config.sandbox.env_passthrough =
      doc.get_string_array("sandbox.env_passthrough", config.sandbox.env_passthrough);

  config.tools.enabled = doc.get_string_array("tools.enabled", config.tools.enabled);
  load_tool_entries(config, doc);

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);

  apply_env_overrides(config);
  resolve_paths(config, home.value());
  return common::Result<Config>::success(std::move(config));
}

common::Status save_config(const Config &config) {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Status::error(cfg_path_result.error());
  }

  using common::quote_toml_string;
  using common::toml_string_array;
  std::ostringstream file;

  file << "[paths]\n";
  file << "groups_dir = " << quote_toml_string(config.paths.groups_dir) << "\n";
  file << "data_dir = " << quote_toml_string(config.paths.data_dir) << "\n";
  file << "tools_dir = " << quote_toml_string(config.paths.tools_dir) << "\n";
  file << "tool_config_dir = " << quote_toml_string(config.paths.tool_config_dir) << "\n";

  file << "\n[daemon]\n";
  file << "socket_path = " << quote_toml_string(config.daemon.socket_path) << "\n";
  file << "scheduler_poll_secs = " << config.daemon.scheduler_poll_secs << "\n";
  file << "state_write_secs = " << config.daemon.state_write_secs << "\n";
  file << "max_queue_depth = " << config.daemon.max_queue_depth << "\n";
  file << "queue_wait_secs = " << config.daemon.queue_wait_secs << "\n";
  file << "interactive_busy_policy = "
       << quote_toml_string(config.daemon.interactive_busy_policy) << "\n";
  file << "scheduled_busy_policy = " << quote_toml_string(config.daemon.scheduled_busy_policy)
       << "\n";

  file << "\n[agent]\n";
  file << "command = " << quote_toml_string(config.agent.command) << "\n";
  file << "args = " << toml_string_array(config.agent.args) << "\n";
  file << "resume_flag = " << quote_toml_string(config.agent.resume_flag) << "\n";
  file << "timeout_secs = " << config.agent.timeout_secs << "\n";
  file << "config_dir = " << quote_toml_string(config.agent.config_dir) << "\n";
  file << "credentials_file = " << quote_toml_string(config.agent.credentials_file) << "\n";
  file << "binary_dirs = " << toml_string_array(config.agent.binary_dirs) << "\n";
  file << "prompt_via_stdin = " << bool_to_toml(config.agent.prompt_via_stdin) << "\n";

  file << "\n[sandbox]\n";
  file << "helper = " << quote_toml_string(config.sandbox.helper) << "\n";
  file << "share_net = " << bool_to_toml(config.sandbox.share_net) << "\n";
  file << "require_tls = " << bool_to_toml(config.sandbox.require_tls) << "\n";
  file << "system_ro_paths = " << toml_string_array(config.sandbox.system_ro_paths) << "\n";
  file << "cert_paths = " << toml_string_array(config.sandbox.cert_paths) << "\n";
  file << "env_passthrough = " << toml_string_array(config.sandbox.env_passthrough) << "\n";

  file << "\n[tools]\n";
  file << "enabled = " << toml_string_array(config.tools.enabled) << "\n";
  for (const auto &tool : config.tools.entries) {
    file << "\n[tools." << tool.name << "]\n";
    if (!tool.env.empty()) {
      file << "env = " << quote_toml_string(tool.env) << "\n";
    }
    if (!tool.token.empty()) {
      file << "token = " << quote_toml_string(tool.token) << "\n";
    }
    if (!tool.token_file.empty()) {
      file << "token_file = " << quote_toml_string(tool.token_file) << "\n";
    }
    file << "network = " << bool_to_toml(tool.network) << "\n";
  }

  file << "\n[observability]\n";
  file << "backend = " << quote_toml_string(config.observability.backend) << "\n";

  return common::write_file_atomic(cfg_path_result.value(), file.str());
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  using ValidationResult = common::Result<std::vector<std::string>>;
  std::vector<std::string> warnings;

  const std::string interactive = common::to_lower(config.daemon.interactive_busy_policy);
  if (interactive != "queue" && interactive != "reject") {
    return ValidationResult::failure("Invalid daemon.interactive_busy_policy: " +
                                     config.daemon.interactive_busy_policy);
  }
  const std::string scheduled = common::to_lower(config.daemon.scheduled_busy_policy);
  if (scheduled != "defer" && scheduled != "queue") {
    return ValidationResult::failure("Invalid daemon.scheduled_busy_policy: " +
                                     config.daemon.scheduled_busy_policy);
  }
  if (config.daemon.scheduler_poll_secs == 0) {
    return ValidationResult::failure("daemon.scheduler_poll_secs must be > 0");
  }
  if (config.agent.timeout_secs == 0) {
    return ValidationResult::failure("agent.timeout_secs must be > 0");
  }
  if (common::trim(config.agent.command).empty()) {
    return ValidationResult::failure("agent.command must not be empty");
  }
  if (common::trim(config.sandbox.helper).empty()) {
    return ValidationResult::failure("sandbox.helper must not be empty");
  }
  if (config.daemon.socket_path.size() >= 108) {
    return ValidationResult::failure("daemon.socket_path is too long for a unix socket: " +
                                     config.daemon.socket_path);
  }

  if (interactive == "queue" && config.daemon.max_queue_depth == 0) {
    warnings.push_back("daemon.max_queue_depth is 0; queued sends will always report busy");
  }
  if (config.agent.resume_flag.empty()) {
    warnings.push_back("agent.resume_flag is empty; sessions will never be resumed");
  }

  if (auto home = common::home_dir(); home.ok() && !config.agent.config_dir.empty()) {
    const auto personal = home.value() / ".claude";
    if (common::normalize_path(config.agent.config_dir) == common::normalize_path(personal)) {
      return ValidationResult::failure(
          "agent.config_dir must not be the personal agent configuration directory");
    }
  }

  for (const auto &tool : config.tools.entries) {
    if (!tool.env.empty() && !is_valid_env_name(tool.env)) {
      return ValidationResult::failure("tools." + tool.name + ".env is not a valid variable name");
    }
  }

  const std::string backend = common::to_lower(config.observability.backend);
  if (backend != "log" && backend != "none" && backend != "noop") {
    warnings.push_back("Unknown observability.backend '" + config.observability.backend +
                       "', falling back to log");
  }

  return ValidationResult::success(std::move(warnings));
}

std::optional<ToolConfig> find_tool_config(const Config &config, const std::string &name) {
  for (const auto &tool : config.tools.entries) {
    if (tool.name == name) {
      return tool;
    }
  }
  return std::nullopt;
}

} // namespace hermit::config
