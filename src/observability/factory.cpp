#include "toolguard/observability/factory.hpp"

#include "toolguard/config/config.hpp"
#include "toolguard/observability/log_observer.hpp"
#include "toolguard/observability/multi_observer.hpp"
#include "toolguard/observability/noop_observer.hpp"

namespace toolguard::observability {

namespace {

// Names validate_config would flag still get a LogObserver.
std::unique_ptr<IObserver> create_backend(const std::string &name) {
  if (name == "noop" || name == "none") {
    return std::make_unique<NoopObserver>();
  }
  return std::make_unique<LogObserver>();
}

} // namespace

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const auto names = config::observability_backends(config);
  if (names.empty()) {
    return std::make_unique<NoopObserver>();
  }
  if (names.size() == 1) {
    return create_backend(names.front());
  }

  auto multi = std::make_unique<MultiObserver>();
  for (const auto &name : names) {
    multi->add(create_backend(name));
  }
  return multi;
}

} // namespace toolguard::observability
