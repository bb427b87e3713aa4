#include "hermit/common/time.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace hermit::common {

std::string now_rfc3339() { return to_rfc3339(Clock::now()); }

std::string to_rfc3339(TimePoint tp) {
  const auto t = Clock::to_time_t(tp);
  std::tm tm{};
  gmtime_r(&t, &tm);

  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return out.str();
}

std::int64_t to_unix_seconds(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

TimePoint from_unix_seconds(std::int64_t seconds) {
  return TimePoint(std::chrono::seconds(seconds));
}

Result<TimePoint> parse_local_datetime(const std::string &text) {
  std::string normalized = text;
  if (normalized.size() > 10 && normalized[10] == 'T') {
    normalized[10] = ' ';
  }

  std::tm tm{};
  const char *formats[] = {"%Y-%m-%d %H:%M:%S", "%Y-%m-%d %H:%M"};
  for (const char *format : formats) {
    tm = std::tm{};
    std::istringstream in(normalized);
    in >> std::get_time(&tm, format);
    if (in.fail()) {
      continue;
    }
    in >> std::ws;
    if (!in.eof()) {
      continue;
    }
    tm.tm_isdst = -1;
    const std::time_t t = std::mktime(&tm);
    if (t == static_cast<std::time_t>(-1)) {
      return Result<TimePoint>::failure("unrepresentable local time: " + text);
    }
    return Result<TimePoint>::success(Clock::from_time_t(t));
  }
  return Result<TimePoint>::failure("invalid date/time: " + text);
}

std::string format_local(TimePoint tp) {
  const auto t = Clock::to_time_t(tp);
  std::tm tm{};
  localtime_r(&t, &tm);

  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%d %H:%M");
  return out.str();
}

} // namespace hermit::common
