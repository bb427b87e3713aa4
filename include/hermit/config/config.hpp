#pragma once

#include "hermit/common/result.hpp"
#include "hermit/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <vector>

namespace hermit::config {

/// `$HERMIT_HOME`, or `~/.hermit`.
[[nodiscard]] common::Result<std::filesystem::path> hermit_home();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] bool config_exists();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();

[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Status save_config(const Config &config);

/// Fatal problems fail; soft problems come back as warnings.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

/// Fills empty path entries from `home` and expands `~` / `$VAR` everywhere.
void resolve_paths(Config &config, const std::filesystem::path &home);

void apply_env_overrides(Config &config);

/// Returns the `[tools.<name>]` override for `name`, if configured.
[[nodiscard]] std::optional<ToolConfig> find_tool_config(const Config &config,
                                                         const std::string &name);

} // namespace hermit::config
