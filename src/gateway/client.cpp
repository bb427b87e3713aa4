#include "hermit/gateway/client.hpp"

#include "hermit/gateway/socket_io.hpp"

#include <unistd.h>

namespace hermit::gateway {

namespace {

constexpr std::size_t MAX_RESPONSE_BYTES = 16 * 1024 * 1024;

} // namespace

IpcClient::IpcClient(std::string socket_path, const std::chrono::seconds timeout)
    : socket_path_(std::move(socket_path)), timeout_(timeout) {}

common::Result<std::string> IpcClient::round_trip(const std::string &line) const {
  auto fd = connect_unix(socket_path_);
  if (!fd.ok()) {
    return common::Result<std::string>::failure("daemon not running (" + fd.error() +
                                                "). Start it with: hermit daemon");
  }
  set_receive_timeout(fd.value(), timeout_);
  auto sent = write_all(fd.value(), line + "\n");
  if (!sent.ok()) {
    close(fd.value());
    return common::Result<std::string>::failure(sent.error());
  }
  auto response = read_line(fd.value(), MAX_RESPONSE_BYTES);
  close(fd.value());
  if (!response.ok()) {
    return response;
  }
  if (response.value().empty()) {
    return common::Result<std::string>::failure("daemon closed the connection without replying");
  }
  return response;
}

common::Result<ClientResponse> IpcClient::call(const Request &request) const {
  auto line = round_trip(encode_request(request));
  if (!line.ok()) {
    return common::Result<ClientResponse>::failure(line.error());
  }
  return decode_response(line.value());
}

bool IpcClient::daemon_reachable() const {
  auto fd = connect_unix(socket_path_);
  if (!fd.ok()) {
    return false;
  }
  close(fd.value());
  return true;
}

} // namespace hermit::gateway
