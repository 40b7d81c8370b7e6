#pragma once

#include "toolguard/observability/observer.hpp"

#include <memory>
#include <vector>

namespace toolguard::observability {

/// Forwards every event and metric to each backend listed in observability.backend,
/// in the order they were added.
class MultiObserver final : public IObserver {
public:
  /// Null observers are ignored.
  void add(std::unique_ptr<IObserver> observer);
  [[nodiscard]] std::size_t size() const { return sinks_.size(); }

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "multi"; }

private:
  template <typename Fn> void each(Fn &&fn) {
    for (const auto &sink : sinks_) {
      fn(*sink);
    }
  }

  std::vector<std::unique_ptr<IObserver>> sinks_;
};

} // namespace toolguard::observability
