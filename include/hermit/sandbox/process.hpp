#pragma once

#include "hermit/common/result.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace hermit::sandbox {

using EnvList = std::vector<std::pair<std::string, std::string>>;

struct ProcessOptions {
  std::chrono::milliseconds timeout{300'000};
  std::string stdin_text;
  /// Complete child environment. When unset the child inherits ours.
  std::optional<EnvList> env;
};

struct ProcessResult {
  int exit_code = 0;
  std::string stdout_text;
  std::string stderr_text;
  bool timed_out = false;
  std::chrono::milliseconds duration{0};
};

/// Runs one child to completion. A nonzero exit or a timeout is a
/// successful run with the outcome recorded in ProcessResult; failure means
/// the child could not be started.
class IProcessRunner {
public:
  virtual ~IProcessRunner() = default;

  [[nodiscard]] virtual common::Result<ProcessResult>
  run(const std::vector<std::string> &argv, const ProcessOptions &options) = 0;
};

/// fork/exec with piped stdio, a bounded wait and SIGKILL on timeout.
class PosixProcessRunner final : public IProcessRunner {
public:
  [[nodiscard]] common::Result<ProcessResult> run(const std::vector<std::string> &argv,
                                                  const ProcessOptions &options) override;
};

/// Looks `name` up on $PATH unless it already contains a '/'.
[[nodiscard]] std::optional<std::string> resolve_executable(const std::string &name);

} // namespace hermit::sandbox
