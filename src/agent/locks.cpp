#include "hermit/agent/locks.hpp"

#include "hermit/observability/global.hpp"

#include <algorithm>

namespace hermit::agent {

WorkspaceLocks::Lease::Lease(WorkspaceLocks *owner, std::string workspace)
    : owner_(owner), workspace_(std::move(workspace)) {}

WorkspaceLocks::Lease::~Lease() { release(); }

WorkspaceLocks::Lease::Lease(Lease &&other) noexcept
    : owner_(other.owner_), workspace_(std::move(other.workspace_)) {
  other.owner_ = nullptr;
}

WorkspaceLocks::Lease &WorkspaceLocks::Lease::operator=(Lease &&other) noexcept {
  if (this != &other) {
    release();
    owner_ = other.owner_;
    workspace_ = std::move(other.workspace_);
    other.owner_ = nullptr;
  }
  return *this;
}

void WorkspaceLocks::Lease::release() {
  if (owner_ != nullptr) {
    owner_->release(workspace_);
    owner_ = nullptr;
  }
}

std::optional<WorkspaceLocks::Lease> WorkspaceLocks::try_acquire(const std::string &workspace) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto &slot = slots_[workspace];
  if (slot.busy || !slot.queue.empty()) {
    return std::nullopt;
  }
  slot.busy = true;
  return Lease(this, workspace);
}

common::Result<WorkspaceLocks::Lease>
WorkspaceLocks::acquire(const std::string &workspace, const std::size_t max_waiters,
                        const std::chrono::milliseconds wait_timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  auto &slot = slots_[workspace];
  if (!slot.busy && slot.queue.empty()) {
    slot.busy = true;
    return common::Result<Lease>::success(Lease(this, workspace));
  }
  if (slot.queue.size() >= max_waiters) {
    return common::Result<Lease>::failure("workspace '" + workspace + "' is busy (" +
                                          std::to_string(slot.queue.size()) + " waiting)");
  }

  const std::uint64_t ticket = next_ticket_++;
  slot.queue.push_back(ticket);
  observability::record_metric(
      observability::QueueDepthMetric{.workspace = workspace, .depth = slot.queue.size()});

  // `slots_` may rehash while we wait, so the slot is looked up again.
  const bool granted = cv_.wait_for(lock, wait_timeout, [&]() {
    const auto &current = slots_[workspace];
    return !current.busy && !current.queue.empty() && current.queue.front() == ticket;
  });
  auto &current = slots_[workspace];
  if (!granted) {
    current.queue.erase(std::remove(current.queue.begin(), current.queue.end(), ticket),
                        current.queue.end());
    drop_if_idle(workspace);
    cv_.notify_all();
    return common::Result<Lease>::failure("timed out waiting for workspace '" + workspace + "'");
  }
  current.queue.pop_front();
  current.busy = true;
  return common::Result<Lease>::success(Lease(this, workspace));
}

bool WorkspaceLocks::is_busy(const std::string &workspace) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = slots_.find(workspace);
  return it != slots_.end() && it->second.busy;
}

std::size_t WorkspaceLocks::waiting(const std::string &workspace) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = slots_.find(workspace);
  return it == slots_.end() ? 0 : it->second.queue.size();
}

void WorkspaceLocks::release(const std::string &workspace) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = slots_.find(workspace);
    if (it == slots_.end()) {
      return;
    }
    it->second.busy = false;
    drop_if_idle(workspace);
  }
  cv_.notify_all();
}

void WorkspaceLocks::drop_if_idle(const std::string &workspace) {
  const auto it = slots_.find(workspace);
  if (it != slots_.end() && !it->second.busy && it->second.queue.empty()) {
    slots_.erase(it);
  }
}

} // namespace hermit::agent
