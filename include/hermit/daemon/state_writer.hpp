#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <thread>

namespace hermit::daemon {

/// Periodically writes `daemon_state.json` (pid, uptime, component health
/// and whatever `extra_fields` contributes) through an atomic rename.
class StateWriter {
public:
  /// Returns extra `"key":value` JSON members, without braces.
  using ExtraFields = std::function<std::string()>;

  StateWriter(std::filesystem::path state_file, std::chrono::seconds interval,
              ExtraFields extra_fields = nullptr);
  ~StateWriter();

  void start();
  /// Stops the loop and removes the state file.
  void stop();
  [[nodiscard]] bool is_running() const;

  void write_state() const;

private:
  void write_loop();

  std::filesystem::path state_file_;
  std::chrono::seconds interval_;
  ExtraFields extra_fields_;
  std::thread thread_;
  std::atomic<bool> running_{false};
  std::chrono::steady_clock::time_point started_at_{};
};

} // namespace hermit::daemon
