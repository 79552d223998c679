#pragma once

#include "ragvix/config/schema.hpp"
#include "ragvix/observability/observer.hpp"

#include <memory>

namespace ragvix::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace ragvix::observability
