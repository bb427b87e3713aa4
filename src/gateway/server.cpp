#include "hermit/gateway/server.hpp"

#include "hermit/gateway/socket_io.hpp"
#include "hermit/health/health.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <poll.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

namespace hermit::gateway {

namespace {

constexpr int kListenBacklog = 16;
constexpr int kAcceptPollMs = 200;

} // namespace

IpcServer::IpcServer(RequestHandler &handler) : handler_(handler) {}

IpcServer::~IpcServer() { stop(); }

common::Status IpcServer::start(const IpcServerOptions &options) {
  if (running_) {
    return common::Status::error("ipc server already running");
  }
  if (!socket_path_fits(options.socket_path)) {
    return common::Status::error("socket path too long: " + options.socket_path);
  }
  health::mark_component_starting("ipc");

  std::error_code ec;
  const std::filesystem::path path(options.socket_path);
  if (std::filesystem::exists(std::filesystem::symlink_status(path, ec))) {
    auto probe = connect_unix(options.socket_path);
    if (probe.ok()) {
      close(probe.value());
      const std::string msg = "another hermit daemon is listening on " + options.socket_path;
      health::mark_component_error("ipc", msg);
      return common::Status::error(msg);
    }
    std::cerr << "[ipc] removing stale socket " << options.socket_path << "\n";
    std::filesystem::remove(path, ec);
    if (ec) {
      return common::Status::error("failed to remove stale socket: " + ec.message());
    }
  }
  std::filesystem::create_directories(path.parent_path(), ec);

  listen_fd_ = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (listen_fd_ < 0) {
    return common::Status::error("failed to create listen socket");
  }

  sockaddr_un addr{};
  addr.sun_family = AF_UNIX;
  std::strncpy(addr.sun_path, options.socket_path.c_str(), sizeof(addr.sun_path) - 1);

  // Owner-only socket.
  const mode_t previous_umask = umask(0177);
  const int bound = bind(listen_fd_, reinterpret_cast<sockaddr *>(&addr), sizeof(addr));
  const int bind_errno = errno;
  umask(previous_umask);
  if (bound != 0) {
    close(listen_fd_);
    listen_fd_ = -1;
    const std::string msg = std::string("bind failed: ") + std::strerror(bind_errno);
    health::mark_component_error("ipc", msg);
    return common::Status::error(msg);
  }
  if (chmod(options.socket_path.c_str(), 0600) != 0) {
    std::cerr << "[ipc] chmod 0600 failed on " << options.socket_path << ": "
              << std::strerror(errno) << "\n";
  }

  if (listen(listen_fd_, kListenBacklog) != 0) {
    const std::string msg = std::strerror(errno);
    close(listen_fd_);
    listen_fd_ = -1;
    std::filesystem::remove(path, ec);
    return common::Status::error("listen failed: " + msg);
  }

  options_ = options;
  running_ = true;
  accept_thread_ = std::thread([this]() { accept_loop(); });
  health::mark_component_ok("ipc");
  return common::Status::success();
}

void IpcServer::stop() {
  if (!running_) {
    return;
  }
  running_ = false;
  if (accept_thread_.joinable()) {
    accept_thread_.join();
  }
  if (listen_fd_ >= 0) {
    close(listen_fd_);
    listen_fd_ = -1;
  }
  reap_workers(true);
  std::error_code ec;
  std::filesystem::remove(options_.socket_path, ec);
  health::reset_component("ipc");
}

bool IpcServer::is_running() const { return running_; }

std::size_t IpcServer::in_flight() const { return in_flight_; }

void IpcServer::accept_loop() {
  while (running_) {
    pollfd pfd{.fd = listen_fd_, .events = POLLIN, .revents = 0};
    const int ready = poll(&pfd, 1, kAcceptPollMs);
    reap_workers(false);
    if (ready <= 0 || !running_) {
      continue;
    }
    const int client = accept4(listen_fd_, nullptr, nullptr, SOCK_CLOEXEC);
    if (client < 0) {
      if (errno != EINTR && errno != EAGAIN) {
        std::cerr << "[ipc] accept failed: " << std::strerror(errno) << "\n";
      }
      continue;
    }

    auto done = std::make_shared<std::atomic<bool>>(false);
    ++in_flight_;
    std::lock_guard<std::mutex> lock(workers_mutex_);
    workers_.push_back(Worker{.thread = std::thread([this, client, done]() {
                                serve(client);
                                close(client);
                                --in_flight_;
                                *done = true;
                              }),
                              .done = done});
  }
}

void IpcServer::serve(const int client_fd) {
  set_receive_timeout(client_fd, options_.read_timeout);
  auto line = read_line(client_fd, MAX_REQUEST_BYTES);
  if (line.ok() && line.value().empty()) {
    return;
  }
  const Response response = line.ok()
                                ? handler_.handle_line(line.value())
                                : Response::failure(ErrorCode::InvalidRequest, line.error());
  auto written = write_all(client_fd, response.to_json() + "\n");
  if (!written.ok()) {
    // The client went away; whatever the request did has already happened.
    std::cerr << "[ipc] response not delivered: " << written.error() << "\n";
  }
}

void IpcServer::reap_workers(const bool wait_all) {
  std::vector<Worker> finished;
  {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    for (auto it = workers_.begin(); it != workers_.end();) {
      if (wait_all || *it->done) {
        finished.push_back(std::move(*it));
        it = workers_.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (auto &worker : finished) {
    if (worker.thread.joinable()) {
      worker.thread.join();
    }
  }
}

} // namespace hermit::gateway
