#pragma once

#include "hermit/common/result.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace hermit::common {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

[[nodiscard]] std::string now_rfc3339();
[[nodiscard]] std::string to_rfc3339(TimePoint tp);

[[nodiscard]] std::int64_t to_unix_seconds(TimePoint tp);
[[nodiscard]] TimePoint from_unix_seconds(std::int64_t seconds);

/// Parses "YYYY-MM-DD HH:MM[:SS]" or "YYYY-MM-DDTHH:MM[:SS]" as local time.
[[nodiscard]] Result<TimePoint> parse_local_datetime(const std::string &text);

/// Local time rendering used in listings, "YYYY-MM-DD HH:MM".
[[nodiscard]] std::string format_local(TimePoint tp);

} // namespace hermit::common
