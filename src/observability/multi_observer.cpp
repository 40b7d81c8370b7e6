#include "toolguard/observability/multi_observer.hpp"

namespace toolguard::observability {

void MultiObserver::add(std::unique_ptr<IObserver> observer) {
  if (observer) {
    sinks_.push_back(std::move(observer));
  }
}

void MultiObserver::record_event(const ObserverEvent &event) {
  each([&event](IObserver &sink) { sink.record_event(event); });
}

void MultiObserver::record_metric(const ObserverMetric &metric) {
  each([&metric](IObserver &sink) { sink.record_metric(metric); });
}

void MultiObserver::flush() {
  each([](IObserver &sink) { sink.flush(); });
}

} // namespace toolguard::observability
