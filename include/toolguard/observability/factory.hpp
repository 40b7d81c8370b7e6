#pragma once

#include "toolguard/config/schema.hpp"
#include "toolguard/observability/observer.hpp"

#include <memory>

namespace toolguard::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace toolguard::observability
