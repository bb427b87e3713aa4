#pragma once

#include "hermit/common/result.hpp"

#include <filesystem>

namespace hermit::daemon {

/// Liveness marker holding the daemon's pid; removed on release.
class PidFile {
public:
  explicit PidFile(std::filesystem::path path);
  ~PidFile();

  PidFile(const PidFile &) = delete;
  PidFile &operator=(const PidFile &) = delete;

  /// Fails when the file names a live process, unless `force` is set.
  [[nodiscard]] common::Status acquire(bool force = false);
  void release();

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  [[nodiscard]] static bool is_process_running(int pid);

private:
  std::filesystem::path path_;
  bool acquired_ = false;
};

} // namespace hermit::daemon
