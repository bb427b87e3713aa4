#include "hermit/observability/factory.hpp"

#include "hermit/common/fs.hpp"
#include "hermit/observability/log_observer.hpp"
#include "hermit/observability/multi_observer.hpp"
#include "hermit/observability/noop_observer.hpp"

#include <sstream>

namespace hermit::observability {

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend.empty() || backend == "none" || backend == "noop") {
    return std::make_unique<NoopObserver>();
  }
  if (backend.find(',') == std::string::npos) {
    return std::make_unique<LogObserver>();
  }

  auto multi = std::make_unique<MultiObserver>();
  std::stringstream stream(backend);
  std::string part;
  while (std::getline(stream, part, ',')) {
    if (common::trim(part) == "log") {
      multi->add(std::make_unique<LogObserver>());
    }
  }
  if (multi->size() == 0) {
    return std::make_unique<NoopObserver>();
  }
  return multi;
}

} // namespace hermit::observability
