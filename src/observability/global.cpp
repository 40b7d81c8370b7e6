#include "toolguard/observability/global.hpp"

#include <mutex>

namespace toolguard::observability {

namespace {

std::mutex g_observer_mutex;
std::shared_ptr<IObserver> g_observer;

// Holding a shared reference keeps the observer alive while an event is recorded,
// even if another thread swaps the global observer at the same time.
std::shared_ptr<IObserver> current_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer;
}

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto observer = current_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto observer = current_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_policy_decision(const std::string &tool, const std::string &outcome,
                            const std::string &reason) {
  record_event(PolicyDecisionEvent{.tool = tool, .outcome = outcome, .reason = reason});
}

void record_risk_match(const std::string &tool, const std::string &level,
                       const std::string &label) {
  record_event(RiskMatchEvent{.tool = tool, .level = level, .label = label});
}

void record_network_request(const std::string &tool, const std::vector<std::string> &targets,
                            const bool exfiltration, const std::string &reason) {
  record_event(NetworkRequestEvent{
      .tool = tool, .targets = targets, .exfiltration = exfiltration, .reason = reason});
}

void record_settings(const std::string &action, const std::string &detail) {
  record_event(SettingsEvent{.action = action, .detail = detail});
}

void record_warning(const std::string &component, const std::string &message) {
  record_event(WarningEvent{.component = component, .message = message});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace toolguard::observability
