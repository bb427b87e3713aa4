#pragma once

#include "hermit/common/result.hpp"
#include "hermit/config/schema.hpp"
#include "hermit/sandbox/process.hpp"
#include "hermit/store/store.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace hermit::sandbox {

/// Fixed in-sandbox location of the workspace root; also the working directory.
inline constexpr const char *SANDBOX_WORKSPACE = "/workspace";

enum class MountKind { Bind, Dir, Tmpfs, Proc, Dev, Symlink };
enum class MountAccess { ReadOnly, ReadWrite };
enum class MountRole { System, Certs, AgentBinary, Tools, AgentConfig, Workspace, Scratch };

[[nodiscard]] std::string mount_role_to_string(MountRole role);

struct Mount {
  MountKind kind = MountKind::Bind;
  std::string source;
  std::string target;
  MountAccess access = MountAccess::ReadOnly;
  MountRole role = MountRole::System;
  /// Host path may be absent (`--ro-bind-try`).
  bool optional = false;
};

struct SandboxPlan {
  std::vector<Mount> mounts;
  /// Environment of the helper process, inherited by the agent. Credentials
  /// live here and never in the helper's argument list.
  EnvList env;
  std::string workdir = SANDBOX_WORKSPACE;
  std::string home;
  bool unshare_all = true;
  bool share_net = true;
  bool die_with_parent = true;
  std::vector<std::string> warnings;

  [[nodiscard]] std::vector<Mount> writable_binds() const;
  [[nodiscard]] std::optional<std::string> env_value(const std::string &key) const;
};

/// Built-in knowledge about a sandbox tool and where its credential lives
/// inside the isolated tool-config directory.
struct ToolSpec {
  std::string name;
  std::string env_var;
  std::string credential_file;
  std::string credential_key;
  bool network = true;
};

[[nodiscard]] const std::vector<ToolSpec> &known_tools();
[[nodiscard]] std::optional<ToolSpec> find_known_tool(const std::string &name);

/// Reads `key: value` from a YAML-ish credential file (first match wins).
[[nodiscard]] std::optional<std::string> read_yaml_value(const std::filesystem::path &path,
                                                         const std::string &key);

/// Maps a workspace plus the tool configuration in `config` to an isolated
/// execution plan. Fails when the workspace directory is missing, when it is
/// not a child of the groups directory, when the agent configuration
/// directory is missing or is the personal one, or when a system mount would
/// expose a protected path. Unknown tools are skipped with a warning.
[[nodiscard]] common::Result<SandboxPlan> compile_plan(const store::Workspace &workspace,
                                                       const config::Config &config);

/// Helper argv: `<helper> <mount flags> --chdir ... [namespace flags] -- <command...>`.
[[nodiscard]] std::vector<std::string> build_helper_args(const std::string &helper,
                                                         const SandboxPlan &plan,
                                                         const std::vector<std::string> &command);

/// Creates the isolated agent configuration directory and copies the
/// personal credentials file into it once, if it exists and no copy is there.
[[nodiscard]] common::Status seed_agent_config(const config::Config &config);

} // namespace hermit::sandbox
