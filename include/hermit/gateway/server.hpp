#pragma once

#include "hermit/common/result.hpp"
#include "hermit/gateway/handler.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace hermit::gateway {

struct IpcServerOptions {
  std::string socket_path;
  /// How long a connected client may take to send its request line.
  std::chrono::seconds read_timeout{30};
};

/// Unix-socket control plane: one JSON request line per connection, one
/// response line, then close. Every connection gets its own thread.
class IpcServer {
public:
  explicit IpcServer(RequestHandler &handler);
  ~IpcServer();

  IpcServer(const IpcServer &) = delete;
  IpcServer &operator=(const IpcServer &) = delete;

  /// Refuses to start when another process answers on the socket path; a
  /// stale socket file is replaced. The socket is created with mode 0600.
  [[nodiscard]] common::Status start(const IpcServerOptions &options);

  /// Stops accepting, waits for in-flight requests and removes the socket.
  void stop();

  [[nodiscard]] bool is_running() const;
  [[nodiscard]] std::size_t in_flight() const;

private:
  struct Worker {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  void accept_loop();
  void serve(int client_fd);
  void reap_workers(bool wait_all);

  RequestHandler &handler_;
  IpcServerOptions options_;
  std::atomic<bool> running_{false};
  int listen_fd_ = -1;
  std::thread accept_thread_;
  std::atomic<std::size_t> in_flight_{0};
  mutable std::mutex workers_mutex_;
  std::vector<Worker> workers_;
};

} // namespace hermit::gateway
