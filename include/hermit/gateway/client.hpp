#pragma once

#include "hermit/common/result.hpp"
#include "hermit/gateway/protocol.hpp"

#include <chrono>
#include <string>

namespace hermit::gateway {

/// One request per connection against a running daemon.
class IpcClient {
public:
  /// `timeout` of zero waits as long as the daemon takes.
  explicit IpcClient(std::string socket_path,
                     std::chrono::seconds timeout = std::chrono::seconds(0));

  [[nodiscard]] common::Result<ClientResponse> call(const Request &request) const;
  [[nodiscard]] common::Result<std::string> round_trip(const std::string &line) const;

  /// True when something accepts connections on the socket path.
  [[nodiscard]] bool daemon_reachable() const;

private:
  std::string socket_path_;
  std::chrono::seconds timeout_;
};

} // namespace hermit::gateway
