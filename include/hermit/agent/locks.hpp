#pragma once

#include "hermit/common/result.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace hermit::agent {

/// Per-workspace execution locks. At most one lease per workspace exists at
/// a time and blocked callers are granted the lock in arrival order.
class WorkspaceLocks {
public:
  class Lease {
  public:
    Lease() = default;
    ~Lease();

    Lease(Lease &&other) noexcept;
    Lease &operator=(Lease &&other) noexcept;
    Lease(const Lease &) = delete;
    Lease &operator=(const Lease &) = delete;

    [[nodiscard]] bool valid() const { return owner_ != nullptr; }
    [[nodiscard]] const std::string &workspace() const { return workspace_; }
    void release();

  private:
    friend class WorkspaceLocks;
    Lease(WorkspaceLocks *owner, std::string workspace);

    WorkspaceLocks *owner_ = nullptr;
    std::string workspace_;
  };

  WorkspaceLocks() = default;
  WorkspaceLocks(const WorkspaceLocks &) = delete;
  WorkspaceLocks &operator=(const WorkspaceLocks &) = delete;

  /// Never blocks. Empty when the workspace is held or has waiters.
  [[nodiscard]] std::optional<Lease> try_acquire(const std::string &workspace);

  /// Waits behind at most `max_waiters` earlier callers for up to
  /// `wait_timeout`. Fails when the queue is full or the wait expires.
  [[nodiscard]] common::Result<Lease> acquire(const std::string &workspace,
                                              std::size_t max_waiters,
                                              std::chrono::milliseconds wait_timeout);

  [[nodiscard]] bool is_busy(const std::string &workspace) const;
  [[nodiscard]] std::size_t waiting(const std::string &workspace) const;

private:
  struct Slot {
    bool busy = false;
    std::deque<std::uint64_t> queue;
  };

  void release(const std::string &workspace);
  void drop_if_idle(const std::string &workspace);

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::unordered_map<std::string, Slot> slots_;
  std::uint64_t next_ticket_ = 0;
};

} // namespace hermit::agent
