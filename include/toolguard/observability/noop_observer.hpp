#pragma once

#include "toolguard/observability/observer.hpp"

namespace toolguard::observability {

/// Backend for `none` and `noop`, and for an empty backend list.
class NoopObserver final : public IObserver {
public:
  void record_event(const ObserverEvent & /*event*/) override {}
  void record_metric(const ObserverMetric & /*metric*/) override {}
  [[nodiscard]] std::string_view name() const override { return "noop"; }
};

} // namespace toolguard::observability
