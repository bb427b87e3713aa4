#include "hermit/daemon/pid_file.hpp"

#include "hermit/common/fs.hpp"

#include <cerrno>
#include <fstream>
#include <iostream>
#include <signal.h>
#include <unistd.h>

namespace hermit::daemon {

PidFile::PidFile(std::filesystem::path path) : path_(std::move(path)) {}

PidFile::~PidFile() { release(); }

common::Status PidFile::acquire(const bool force) {
  if (acquired_) {
    return common::Status::success();
  }

  std::error_code ec;
  std::filesystem::create_directories(path_.parent_path(), ec);
  if (ec) {
    return common::Status::error("failed to create pid directory: " + ec.message());
  }

  if (std::filesystem::exists(path_)) {
    std::ifstream in(path_);
    int existing_pid = 0;
    in >> existing_pid;
    if (existing_pid > 0 && is_process_running(existing_pid)) {
      if (!force) {
        return common::Status::error("daemon already running with pid " +
                                     std::to_string(existing_pid) +
                                     " (use --force if that process is not hermit)");
      }
      std::cerr << "[daemon] overriding pid file held by " << existing_pid << "\n";
    }
    std::filesystem::remove(path_, ec);
  }

  auto written = common::write_file_atomic(path_, std::to_string(getpid()) + "\n");
  if (!written.ok()) {
    return common::Status::error("failed to write pid file: " + written.error());
  }
  acquired_ = true;
  return common::Status::success();
}

void PidFile::release() {
  if (!acquired_) {
    return;
  }
  std::error_code ec;
  std::filesystem::remove(path_, ec);
  acquired_ = false;
}

bool PidFile::is_process_running(const int pid) {
  if (pid <= 0) {
    return false;
  }
  return kill(pid, 0) == 0 || errno == EPERM;
}

} // namespace hermit::daemon
