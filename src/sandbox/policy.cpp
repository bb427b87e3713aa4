#include "hermit/sandbox/policy.hpp"

#include "hermit/common/fs.hpp"
#include "hermit/config/config.hpp"

#include <cstdlib>
#include <fstream>

namespace hermit::sandbox {

namespace {

namespace fs = std::filesystem;

bool is_dir(const fs::path &path) {
  std::error_code ec;
  return fs::is_directory(path, ec);
}

bool path_exists(const fs::path &path) {
  std::error_code ec;
  return fs::exists(path, ec);
}

std::string strip_quotes(std::string value) {
  value = common::trim(value);
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
      value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

/// Host locations no mount other than the workspace and agent-config mounts
/// may reach.
class ProtectedPaths {
public:
  ProtectedPaths(fs::path home, fs::path groups, fs::path personal_config)
      : home_(std::move(home)), groups_(std::move(groups)),
        personal_config_(std::move(personal_config)) {}

  [[nodiscard]] std::optional<std::string> exposure(const std::string &source) const {
    const fs::path path = common::normalize_path(source);
    if (common::is_subpath(home_, path)) {
      return "it contains the home directory";
    }
    if (common::is_subpath(groups_, path) || common::is_subpath(path, groups_)) {
      return "it overlaps the workspaces directory";
    }
    if (common::is_subpath(personal_config_, path) ||
        common::is_subpath(path, personal_config_)) {
      return "it overlaps the personal agent configuration";
    }
    return std::nullopt;
  }

private:
  fs::path home_;
  fs::path groups_;
  fs::path personal_config_;
};

Mount bind(std::string source, std::string target, MountAccess access, MountRole role,
           bool optional = false) {
  Mount mount;
  mount.kind = MountKind::Bind;
  mount.source = std::move(source);
  mount.target = std::move(target);
  mount.access = access;
  mount.role = role;
  mount.optional = optional;
  return mount;
}

Mount special(MountKind kind, std::string target, std::string source = "") {
  Mount mount;
  mount.kind = kind;
  mount.source = std::move(source);
  mount.target = std::move(target);
  mount.role = MountRole::Scratch;
  return mount;
}

std::string resolve_tool_token(const config::Config &config, const std::optional<ToolSpec> &spec,
                               const std::optional<config::ToolConfig> &override_config) {
  if (override_config.has_value()) {
    if (!override_config->token.empty()) {
      return override_config->token;
    }
    if (!override_config->token_file.empty()) {
      if (auto content = common::read_file(override_config->token_file); content.ok()) {
        return common::trim(content.value());
      }
      return "";
    }
  }
  if (spec.has_value() && !spec->credential_file.empty()) {
    const fs::path file = fs::path(config.paths.tool_config_dir) / spec->credential_file;
    return read_yaml_value(file, spec->credential_key).value_or("");
  }
  return "";
}

std::string user_name(const fs::path &home) {
  if (const char *user = std::getenv("USER"); user != nullptr && *user != '\0') {
    return user;
  }
  return home.filename().string();
}

} // namespace

std::string mount_role_to_string(const MountRole role) {
  switch (role) {
  case MountRole::System:
    return "system";
  case MountRole::Certs:
    return "certs";
  case MountRole::AgentBinary:
    return "agent_binary";
  case MountRole::Tools:
    return "tools";
  case MountRole::AgentConfig:
    return "agent_config";
  case MountRole::Workspace:
    return "workspace";
  case MountRole::Scratch:
    return "scratch";
  }
  return "system";
}

std::vector<Mount> SandboxPlan::writable_binds() const {
  std::vector<Mount> out;
  for (const auto &mount : mounts) {
    if (mount.kind == MountKind::Bind && mount.access == MountAccess::ReadWrite) {
      out.push_back(mount);
    }
  }
  return out;
}

std::optional<std::string> SandboxPlan::env_value(const std::string &key) const {
  for (const auto &[name, value] : env) {
    if (name == key) {
      return value;
    }
  }
  return std::nullopt;
}

const std::vector<ToolSpec> &known_tools() {
  static const std::vector<ToolSpec> tools = {
      {.name = "gh", .env_var = "GH_TOKEN", .credential_file = "gh/hosts.yml",
       .credential_key = "oauth_token", .network = true},
      {.name = "glab", .env_var = "GITLAB_TOKEN", .credential_file = "glab-cli/config.yml",
       .credential_key = "token", .network = true},
      {.name = "jq", .network = false},
      {.name = "yq", .network = false},
      {.name = "rg", .network = false},
      {.name = "fd", .network = false},
      {.name = "fzf", .network = false},
  };
  return tools;
}

std::optional<ToolSpec> find_known_tool(const std::string &name) {
  for (const auto &tool : known_tools()) {
    if (tool.name == name) {
      return tool;
    }
  }
  return std::nullopt;
}

std::optional<std::string> read_yaml_value(const fs::path &path, const std::string &key) {
  std::ifstream in(path);
  if (!in) {
    return std::nullopt;
  }
  const std::string prefix = key + ":";
  std::string line;
  while (std::getline(in, line)) {
    const std::string trimmed = common::trim(line);
    if (!common::starts_with(trimmed, prefix)) {
      continue;
    }
    std::string value = strip_quotes(trimmed.substr(prefix.size()));
    if (!value.empty()) {
      return value;
    }
  }
  return std::nullopt;
}

common::Result<SandboxPlan> compile_plan(const store::Workspace &workspace,
                                         const config::Config &config) {
  const auto home_result = common::home_dir();
  if (!home_result.ok()) {
    return common::Result<SandboxPlan>::failure(home_result.error());
  }
  const fs::path home = common::normalize_path(home_result.value());
  const fs::path groups = common::normalize_path(config.paths.groups_dir);
  const fs::path root = common::normalize_path(workspace.root);
  const fs::path personal_config = home / ".claude";
  const fs::path agent_config = common::normalize_path(config.agent.config_dir);

  if (root == groups || !common::is_subpath(root, groups)) {
    return common::Result<SandboxPlan>::failure("workspace root " + root.string() +
                                                " is not inside " + groups.string());
  }
  if (!is_dir(root)) {
    return common::Result<SandboxPlan>::failure("workspace directory does not exist: " +
                                                root.string());
  }
  if (common::is_subpath(agent_config, personal_config) ||
      common::is_subpath(personal_config, agent_config)) {
    return common::Result<SandboxPlan>::failure(
        "agent configuration directory overlaps the personal one: " + agent_config.string());
  }
  if (common::is_subpath(agent_config, groups) || common::is_subpath(groups, agent_config)) {
    return common::Result<SandboxPlan>::failure(
        "agent configuration directory overlaps the workspaces directory");
  }
  if (!is_dir(agent_config)) {
    return common::Result<SandboxPlan>::failure("agent configuration directory does not exist: " +
                                                agent_config.string());
  }

  const ProtectedPaths guard(home, groups, personal_config);
  SandboxPlan plan;
  plan.home = home.string();
  plan.share_net = config.sandbox.share_net;

  // Credentials first: they decide whether TLS trust roots are needed.
  EnvList credentials;
  bool needs_tls = config.sandbox.require_tls;
  for (const auto &name : config.tools.enabled) {
    const auto spec = find_known_tool(name);
    const auto override_config = config::find_tool_config(config, name);
    if (!spec.has_value() && !override_config.has_value()) {
      plan.warnings.push_back("unknown tool '" + name + "' skipped");
      continue;
    }
    needs_tls = needs_tls || (override_config.has_value() ? override_config->network
                                                          : spec->network);
    const std::string env_var = override_config.has_value() && !override_config->env.empty()
                                    ? override_config->env
                                    : (spec.has_value() ? spec->env_var : "");
    if (env_var.empty()) {
      continue;
    }
    const std::string token = resolve_tool_token(config, spec, override_config);
    if (token.empty()) {
      plan.warnings.push_back("no credential found for tool '" + name + "'");
      continue;
    }
    credentials.emplace_back(env_var, token);
  }

  for (const auto &path : config.sandbox.system_ro_paths) {
    if (auto reason = guard.exposure(path); reason.has_value()) {
      return common::Result<SandboxPlan>::failure("refusing system mount " + path + ": " +
                                                  *reason);
    }
    plan.mounts.push_back(bind(path, path, MountAccess::ReadOnly, MountRole::System, true));
  }
  if (needs_tls) {
    for (const auto &path : config.sandbox.cert_paths) {
      if (auto reason = guard.exposure(path); reason.has_value()) {
        return common::Result<SandboxPlan>::failure("refusing certificate mount " + path + ": " +
                                                    *reason);
      }
      plan.mounts.push_back(bind(path, path, MountAccess::ReadOnly, MountRole::Certs, true));
    }
  }
  plan.mounts.push_back(special(MountKind::Symlink, "/sbin", "/usr/bin"));
  plan.mounts.push_back(special(MountKind::Proc, "/proc"));
  plan.mounts.push_back(special(MountKind::Dev, "/dev"));
  plan.mounts.push_back(special(MountKind::Tmpfs, "/tmp"));
  plan.mounts.push_back(
      bind(root.string(), SANDBOX_WORKSPACE, MountAccess::ReadWrite, MountRole::Workspace));
  plan.mounts.push_back(special(MountKind::Tmpfs, "/home"));
  plan.mounts.push_back(special(MountKind::Dir, home.string()));
  plan.mounts.push_back(bind(agent_config.string(), personal_config.string(),
                             MountAccess::ReadWrite, MountRole::AgentConfig));

  std::vector<std::string> path_entries;
  const auto add_host_mount = [&](const std::string &raw, MountRole role) {
    if (raw.empty() || !path_exists(raw)) {
      return false;
    }
    const std::string path = common::normalize_path(raw).string();
    if (auto reason = guard.exposure(path); reason.has_value()) {
      plan.warnings.push_back("skipping " + mount_role_to_string(role) + " mount " + path +
                              ": " + *reason);
      return false;
    }
    plan.mounts.push_back(bind(path, path, MountAccess::ReadOnly, role));
    return true;
  };

  if (add_host_mount(config.paths.tools_dir, MountRole::Tools)) {
    path_entries.push_back(common::normalize_path(config.paths.tools_dir).string());
  }
  for (const auto &dir : config.agent.binary_dirs) {
    if (add_host_mount(dir, MountRole::AgentBinary) && fs::path(dir).filename() == "bin") {
      path_entries.push_back(common::normalize_path(dir).string());
    }
  }
  path_entries.insert(path_entries.end(), {"/usr/local/bin", "/usr/bin", "/bin"});

  std::string path_value;
  for (const auto &entry : path_entries) {
    if (!path_value.empty()) {
      path_value.push_back(':');
    }
    path_value += entry;
  }

  const std::string workdir = SANDBOX_WORKSPACE;
  plan.env = {
      {"HOME", home.string()},
      {"USER", user_name(home)},
      {"PATH", path_value},
      {"LANG", "C.UTF-8"},
      {"XDG_STATE_HOME", workdir + "/.state"},
      {"XDG_CACHE_HOME", workdir + "/.state/cache"},
  };
  for (const auto &name : config.sandbox.env_passthrough) {
    if (plan.env_value(name).has_value()) {
      continue;
    }
    if (const char *value = std::getenv(name.c_str()); value != nullptr && *value != '\0') {
      plan.env.emplace_back(name, value);
    }
  }
  for (auto &credential : credentials) {
    plan.env.push_back(std::move(credential));
  }

  return common::Result<SandboxPlan>::success(std::move(plan));
}

std::vector<std::string> build_helper_args(const std::string &helper, const SandboxPlan &plan,
                                           const std::vector<std::string> &command) {
  std::vector<std::string> args = {helper};
  for (const auto &mount : plan.mounts) {
    switch (mount.kind) {
    case MountKind::Bind:
      if (mount.access == MountAccess::ReadWrite) {
        args.push_back(mount.optional ? "--bind-try" : "--bind");
      } else {
        args.push_back(mount.optional ? "--ro-bind-try" : "--ro-bind");
      }
      args.push_back(mount.source);
      args.push_back(mount.target);
      break;
    case MountKind::Dir:
      args.insert(args.end(), {"--dir", mount.target});
      break;
    case MountKind::Tmpfs:
      args.insert(args.end(), {"--tmpfs", mount.target});
      break;
    case MountKind::Proc:
      args.insert(args.end(), {"--proc", mount.target});
      break;
    case MountKind::Dev:
      args.insert(args.end(), {"--dev", mount.target});
      break;
    case MountKind::Symlink:
      args.insert(args.end(), {"--symlink", mount.source, mount.target});
      break;
    }
  }
  args.insert(args.end(), {"--chdir", plan.workdir});
  if (plan.unshare_all) {
    args.push_back("--unshare-all");
  }
  if (plan.share_net) {
    args.push_back("--share-net");
  }
  if (plan.die_with_parent) {
    args.push_back("--die-with-parent");
  }
  args.push_back("--");
  args.insert(args.end(), command.begin(), command.end());
  return args;
}

common::Status seed_agent_config(const config::Config &config) {
  const fs::path dir(config.agent.config_dir);
  if (auto ensured = common::ensure_dir(dir); !ensured.ok()) {
    return common::Status::error(ensured.error());
  }
  std::error_code ec;
  fs::permissions(dir, fs::perms::owner_all, fs::perm_options::replace, ec);

  if (config.agent.credentials_file.empty()) {
    return common::Status::success();
  }
  const fs::path source(config.agent.credentials_file);
  const fs::path target = dir / source.filename();
  if (!path_exists(source) || path_exists(target)) {
    return common::Status::success();
  }
  fs::copy_file(source, target, fs::copy_options::skip_existing, ec);
  if (ec) {
    return common::Status::error("failed to copy agent credentials: " + ec.message());
  }
  fs::permissions(target, fs::perms::owner_read | fs::perms::owner_write,
                  fs::perm_options::replace, ec);
  return common::Status::success();
}

} // namespace hermit::sandbox
