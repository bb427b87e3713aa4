#include "test_framework.hpp"

#include "hermit/agent/locks.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace {

bool wait_until(const std::function<bool()> &condition, std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (condition()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return condition();
}

} // namespace

void register_locks_tests(std::vector<hermit::tests::TestCase> &tests) {
  using hermit::tests::require;
  using hermit::agent::WorkspaceLocks;
  using namespace std::chrono_literals;

  tests.push_back({"locks_try_acquire_is_exclusive_per_workspace", [] {
                     WorkspaceLocks locks;
                     auto first = locks.try_acquire("alpha");
                     require(first.has_value() && first->valid(), "first lease");
                     require(locks.is_busy("alpha"), "alpha busy");
                     require(!locks.try_acquire("alpha").has_value(), "second lease refused");

                     auto other = locks.try_acquire("beta");
                     require(other.has_value(), "other workspaces are independent");

                     first->release();
                     require(!first->valid(), "released lease is invalid");
                     require(!locks.is_busy("alpha"), "alpha free again");
                     require(locks.try_acquire("alpha").has_value(), "lease after release");
                   }});

  tests.push_back({"locks_lease_releases_on_destruction_and_move", [] {
                     WorkspaceLocks locks;
                     {
                       auto lease = locks.try_acquire("alpha");
                       require(lease.has_value(), "lease");
                       WorkspaceLocks::Lease moved = std::move(*lease);
                       require(moved.valid() && !lease->valid(), "ownership moves");
                       require(locks.is_busy("alpha"), "still busy after move");
                     }
                     require(!locks.is_busy("alpha"), "destructor releases");
                   }});

  tests.push_back({"locks_waiters_are_served_in_arrival_order", [] {
                     WorkspaceLocks locks;
                     auto holder = locks.try_acquire("alpha");
                     require(holder.has_value(), "holder lease");

                     std::mutex order_mutex;
                     std::vector<int> order;
                     std::vector<std::thread> threads;
                     for (int i = 0; i < 3; ++i) {
                       threads.emplace_back([&, i] {
                         auto lease = locks.acquire("alpha", 8, 5000ms);
                         if (lease.ok()) {
                           std::lock_guard<std::mutex> lock(order_mutex);
                           order.push_back(i);
                         }
                       });
                       require(wait_until([&] { return locks.waiting("alpha") ==
                                                       static_cast<std::size_t>(i + 1); },
                                          2000ms),
                               "waiter did not queue");
                     }
                     require(!locks.try_acquire("alpha").has_value(),
                             "try_acquire never jumps the queue");
                     holder->release();
                     for (auto &thread : threads) {
                       thread.join();
                     }
                     require(order == std::vector<int>({0, 1, 2}), "FIFO order violated");
                     require(!locks.is_busy("alpha") && locks.waiting("alpha") == 0, "idle");
                   }});

  tests.push_back({"locks_full_queue_reports_busy", [] {
                     WorkspaceLocks locks;
                     auto holder = locks.try_acquire("alpha");
                     std::thread waiter([&] { (void)locks.acquire("alpha", 1, 2000ms); });
                     require(wait_until([&] { return locks.waiting("alpha") == 1; }, 2000ms),
                             "waiter did not queue");
                     auto rejected = locks.acquire("alpha", 1, 2000ms);
                     require(!rejected.ok(), "queue is full");
                     require(rejected.error().find("busy") != std::string::npos, "busy message");
                     holder->release();
                     waiter.join();
                   }});

  tests.push_back({"locks_wait_times_out_and_leaves_queue", [] {
                     WorkspaceLocks locks;
                     auto holder = locks.try_acquire("alpha");
                     const auto started = std::chrono::steady_clock::now();
                     auto waited = locks.acquire("alpha", 4, 100ms);
                     require(!waited.ok(), "wait should time out");
                     require(std::chrono::steady_clock::now() - started >= 90ms,
                             "waited about the timeout");
                     require(locks.waiting("alpha") == 0, "ticket removed after timeout");
                     holder->release();
                     require(locks.try_acquire("alpha").has_value(), "usable after timeout");
                   }});

  tests.push_back({"locks_mutual_exclusion_under_contention", [] {
                     WorkspaceLocks locks;
                     std::atomic<int> inside{0};
                     std::atomic<int> max_inside{0};
                     std::atomic<int> completed{0};
                     std::vector<std::thread> threads;
                     for (int i = 0; i < 8; ++i) {
                       threads.emplace_back([&] {
                         for (int round = 0; round < 20; ++round) {
                           auto lease = locks.acquire("shared", 16, 10000ms);
                           if (!lease.ok()) {
                             continue;
                           }
                           const int now_inside = ++inside;
                           int expected = max_inside.load();
                           while (now_inside > expected &&
                                  !max_inside.compare_exchange_weak(expected, now_inside)) {
                           }
                           std::this_thread::sleep_for(100us);
                           --inside;
                           ++completed;
                         }
                       });
                     }
                     for (auto &thread : threads) {
                       thread.join();
                     }
                     require(max_inside == 1, "two holders at once");
                     require(completed == 160, "every acquisition should succeed");
                   }});
}
