#include "hermit/scheduler/trigger.hpp"

#include "hermit/common/fs.hpp"

#include <algorithm>
#include <cctype>

namespace hermit::scheduler {

namespace {

constexpr const char *TRIGGER_USAGE =
    "use @hourly, @daily, @weekly, */N, once:+N[s|m|h] or once:YYYY-MM-DDTHH:MM";

common::Result<Trigger> invalid(const std::string &text) {
  return common::Result<Trigger>::failure("invalid trigger '" + text + "': " + TRIGGER_USAGE);
}

std::optional<long long> parse_count(const std::string &digits) {
  if (digits.empty() || digits.size() > 9 ||
      !std::all_of(digits.begin(), digits.end(),
                   [](const unsigned char ch) { return std::isdigit(ch) != 0; })) {
    return std::nullopt;
  }
  return std::stoll(digits);
}

common::Result<Trigger> parse_relative(const std::string &original, const std::string &offset,
                                       const common::TimePoint now) {
  const char unit = offset.back();
  const auto count = parse_count(offset.substr(1, offset.size() - 2));
  if (!count.has_value()) {
    return invalid(original);
  }
  std::chrono::seconds delta{0};
  switch (unit) {
  case 's':
    delta = std::chrono::seconds(*count);
    break;
  case 'm':
    delta = std::chrono::minutes(*count);
    break;
  case 'h':
    delta = std::chrono::hours(*count);
    break;
  default:
    return invalid(original);
  }
  return common::Result<Trigger>::success(OneShotTrigger{.at = now + delta});
}

} // namespace

common::Result<Trigger> parse_trigger(const std::string &text, const common::TimePoint now) {
  const std::string trimmed = common::trim(text);
  const std::string lowered = common::to_lower(trimmed);

  if (lowered == "@hourly") {
    return common::Result<Trigger>::success(IntervalTrigger{.period = std::chrono::minutes(60)});
  }
  if (lowered == "@daily") {
    return common::Result<Trigger>::success(IntervalTrigger{.period = std::chrono::minutes(1440)});
  }
  if (lowered == "@weekly") {
    return common::Result<Trigger>::success(
        IntervalTrigger{.period = std::chrono::minutes(10080)});
  }
  if (common::starts_with(lowered, "*/")) {
    const auto minutes = parse_count(lowered.substr(2));
    if (!minutes.has_value() || *minutes <= 0) {
      return invalid(trimmed);
    }
    return common::Result<Trigger>::success(
        IntervalTrigger{.period = std::chrono::minutes(*minutes)});
  }
  if (common::starts_with(lowered, "once:")) {
    const std::string value = common::trim(trimmed.substr(5));
    if (value.size() >= 3 && value.front() == '+') {
      return parse_relative(trimmed, common::to_lower(value), now);
    }
    auto at = common::parse_local_datetime(value);
    if (!at.ok()) {
      return invalid(trimmed);
    }
    return common::Result<Trigger>::success(OneShotTrigger{.at = at.value()});
  }
  return invalid(trimmed);
}

bool is_one_shot(const Trigger &trigger) { return std::holds_alternative<OneShotTrigger>(trigger); }

common::TimePoint first_run(const Trigger &trigger, const common::TimePoint now) {
  if (const auto *interval = std::get_if<IntervalTrigger>(&trigger)) {
    return now + interval->period;
  }
  return std::get<OneShotTrigger>(trigger).at;
}

std::optional<common::TimePoint> next_after(const Trigger &trigger, const common::TimePoint now,
                                            const common::TimePoint scheduled) {
  if (const auto *interval = std::get_if<IntervalTrigger>(&trigger)) {
    return std::max(now, scheduled) + interval->period;
  }
  return std::nullopt;
}

} // namespace hermit::scheduler
