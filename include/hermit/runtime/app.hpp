#pragma once

#include "hermit/common/result.hpp"
#include "hermit/config/schema.hpp"
#include "hermit/store/store.hpp"

#include <filesystem>
#include <memory>

namespace hermit::runtime {

/// Loaded configuration plus the process-wide setup every entry point needs.
class RuntimeContext {
public:
  explicit RuntimeContext(config::Config config);

  [[nodiscard]] static common::Result<RuntimeContext> from_disk();

  [[nodiscard]] const config::Config &config() const;
  [[nodiscard]] config::Config &mutable_config();

  /// Installs the configured observer as the global one.
  void install_observer() const;

  /// Creates the hermit directory layout.
  [[nodiscard]] common::Status ensure_layout() const;

  [[nodiscard]] std::filesystem::path database_path() const;
  [[nodiscard]] common::Result<std::unique_ptr<store::Store>> open_store() const;

private:
  config::Config config_;
};

} // namespace hermit::runtime
