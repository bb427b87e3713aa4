#pragma once

#include "hermit/common/result.hpp"

#include <chrono>
#include <cstddef>
#include <string>

namespace hermit::gateway {

/// Whether `path` fits in `sockaddr_un::sun_path`.
[[nodiscard]] bool socket_path_fits(const std::string &path);

/// Connected AF_UNIX stream socket. The caller owns the descriptor.
[[nodiscard]] common::Result<int> connect_unix(const std::string &path);

/// Reads up to the first newline (not included) or EOF. Fails past `max_bytes`.
[[nodiscard]] common::Result<std::string> read_line(int fd, std::size_t max_bytes);

[[nodiscard]] common::Status write_all(int fd, const std::string &data);

/// SO_RCVTIMEO; zero means wait forever.
void set_receive_timeout(int fd, std::chrono::seconds timeout);

} // namespace hermit::gateway
