#pragma once

#include "runclaw/config/schema.hpp"
#include "runclaw/observability/observer.hpp"

#include <memory>

namespace runclaw::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace runclaw::observability
