#pragma once

#include "hermit/common/result.hpp"

#include <cstddef>
#include <string>

namespace hermit::common {

/// Lowercase hex of `bytes` bytes from the OpenSSL CSPRNG.
[[nodiscard]] Result<std::string> random_hex(std::size_t bytes);

} // namespace hermit::common
