#pragma once

#include "hermit/config/schema.hpp"
#include "hermit/observability/observer.hpp"

#include <memory>

namespace hermit::observability {

/// `observability.backend`: "log", "none"/"noop", or a comma list of those.
[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace hermit::observability
