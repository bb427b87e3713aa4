#include "hermit/runtime/app.hpp"

#include "hermit/common/fs.hpp"
#include "hermit/config/config.hpp"
#include "hermit/observability/factory.hpp"
#include "hermit/observability/global.hpp"

#include <iostream>

namespace hermit::runtime {

RuntimeContext::RuntimeContext(config::Config config) : config_(std::move(config)) {}

common::Result<RuntimeContext> RuntimeContext::from_disk() {
  auto loaded = config::load_config();
  if (!loaded.ok()) {
    return common::Result<RuntimeContext>::failure(loaded.error());
  }
  auto validated = config::validate_config(loaded.value());
  if (!validated.ok()) {
    return common::Result<RuntimeContext>::failure("invalid config: " + validated.error());
  }
  for (const auto &warning : validated.value()) {
    std::cerr << "[config] warning: " << warning << "\n";
  }
  return common::Result<RuntimeContext>::success(RuntimeContext(std::move(loaded.value())));
}

const config::Config &RuntimeContext::config() const { return config_; }

config::Config &RuntimeContext::mutable_config() { return config_; }

void RuntimeContext::install_observer() const {
  observability::set_global_observer(observability::create_observer(config_));
}

common::Status RuntimeContext::ensure_layout() const {
  for (const auto &dir : {config_.paths.home, config_.paths.groups_dir, config_.paths.data_dir,
                          config_.paths.tools_dir, config_.paths.tool_config_dir}) {
    if (dir.empty()) {
      continue;
    }
    auto made = common::ensure_dir(dir);
    if (!made.ok()) {
      return common::Status::error(made.error());
    }
  }
  return common::Status::success();
}

std::filesystem::path RuntimeContext::database_path() const {
  return std::filesystem::path(config_.paths.data_dir) / "hermit.db";
}

common::Result<std::unique_ptr<store::Store>> RuntimeContext::open_store() const {
  auto opened = std::make_unique<store::Store>(database_path(), config_.paths.groups_dir);
  auto status = opened->status();
  if (!status.ok()) {
    return common::Result<std::unique_ptr<store::Store>>::failure(status.error());
  }
  return common::Result<std::unique_ptr<store::Store>>::success(std::move(opened));
}

} // namespace hermit::runtime
