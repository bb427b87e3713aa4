#pragma once

#include "hermit/common/result.hpp"
#include "hermit/common/time.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <variant>

namespace hermit::scheduler {

/// Fires every `period`, starting one period after creation.
struct IntervalTrigger {
  std::chrono::minutes period{0};
};

/// Fires once at `at`.
struct OneShotTrigger {
  common::TimePoint at{};
};

using Trigger = std::variant<IntervalTrigger, OneShotTrigger>;

/// Grammar: `@hourly`, `@daily`, `@weekly`, `*/N` (minutes, N > 0),
/// `once:+N<s|m|h>` relative to `now`, `once:YYYY-MM-DD[T ]HH:MM[:SS]` local time.
[[nodiscard]] common::Result<Trigger> parse_trigger(const std::string &text, common::TimePoint now);

[[nodiscard]] bool is_one_shot(const Trigger &trigger);

/// First scheduled time for a freshly created task.
[[nodiscard]] common::TimePoint first_run(const Trigger &trigger, common::TimePoint now);

/// Next time after a firing that was scheduled for `scheduled`. Recurring
/// triggers advance from the later of `now` and `scheduled`, so missed
/// periods are not replayed. One-shot triggers have no next time.
[[nodiscard]] std::optional<common::TimePoint>
next_after(const Trigger &trigger, common::TimePoint now, common::TimePoint scheduled);

} // namespace hermit::scheduler
