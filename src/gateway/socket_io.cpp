#include "hermit/gateway/socket_io.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/un.h>
#include <unistd.h>

namespace hermit::gateway {

bool socket_path_fits(const std::string &path) {
  sockaddr_un addr{};
  return !path.empty() && path.size() < sizeof(addr.sun_path);
}

common::Result<int> connect_unix(const std::string &path) {
  if (!socket_path_fits(path)) {
    return common::Result<int>::failure("socket path too long: " + path);
  }
  const int fd = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (fd < 0) {
    return common::Result<int>::failure(std::string("socket failed: ") + std::strerror(errno));
  }
  sockaddr_un addr{};
  addr.sun_family = AF_UNIX;
  std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
  if (connect(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0) {
    const std::string msg = std::strerror(errno);
    close(fd);
    return common::Result<int>::failure("connect " + path + " failed: " + msg);
  }
  return common::Result<int>::success(fd);
}

common::Result<std::string> read_line(const int fd, const std::size_t max_bytes) {
  std::string data;
  std::array<char, 4096> buf{};
  while (true) {
    const ssize_t n = recv(fd, buf.data(), buf.size(), 0);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        return common::Result<std::string>::failure("timed out reading from socket");
      }
      return common::Result<std::string>::failure(std::string("recv failed: ") +
                                                  std::strerror(errno));
    }
    if (n == 0) {
      break;
    }
    data.append(buf.data(), static_cast<std::size_t>(n));
    const auto newline = data.find('\n');
    if (newline != std::string::npos) {
      data.resize(newline);
      break;
    }
    if (data.size() > max_bytes) {
      return common::Result<std::string>::failure("message exceeds " + std::to_string(max_bytes) +
                                                  " bytes");
    }
  }
  return common::Result<std::string>::success(std::move(data));
}

common::Status write_all(const int fd, const std::string &data) {
  std::size_t offset = 0;
  while (offset < data.size()) {
    const ssize_t n = send(fd, data.data() + offset, data.size() - offset, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return common::Status::error(std::string("send failed: ") + std::strerror(errno));
    }
    offset += static_cast<std::size_t>(n);
  }
  return common::Status::success();
}

void set_receive_timeout(const int fd, const std::chrono::seconds timeout) {
  timeval tv{};
  tv.tv_sec = static_cast<time_t>(timeout.count());
  tv.tv_usec = 0;
  (void)setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
}

} // namespace hermit::gateway
