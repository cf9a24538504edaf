#include "runclaw/observability/factory.hpp"

#include "runclaw/common/fs.hpp"
#include "runclaw/observability/log_observer.hpp"
#include "runclaw/observability/multi_observer.hpp"
#include "runclaw/observability/noop_observer.hpp"

#include <sstream>

namespace runclaw::observability {

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const LogLevel level =
      parse_log_level(common::trim(config.observability.log_level)).value_or(LogLevel::Info);
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend.empty() || backend == "none" || backend == "noop") {
    return std::make_unique<NoopObserver>();
  }

  if (backend == "log") {
    return std::make_unique<LogObserver>(level);
  }

  if (backend.find(',') != std::string::npos) {
    auto multi = std::make_unique<MultiObserver>();
    std::stringstream stream(backend);
    std::string part;
    while (std::getline(stream, part, ',')) {
      const std::string p = common::trim(part);
      if (p == "log") {
        multi->add(std::make_unique<LogObserver>(level));
      } else if (p == "noop" || p == "none") {
        multi->add(std::make_unique<NoopObserver>());
      }
    }
    return multi;
  }

  return std::make_unique<LogObserver>(level);
}

} // namespace runclaw::observability
