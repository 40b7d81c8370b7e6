#include "toolguard/observability/log_observer.hpp"

#include "toolguard/common/fs.hpp"

#include <iostream>
#include <type_traits>

namespace toolguard::observability {

LogObserver::LogObserver() : out_(&std::cerr) {}

LogObserver::LogObserver(std::ostream &out) : out_(&out) {}

void LogObserver::log_line(const std::string_view level, const std::string &message) {
  std::lock_guard<std::mutex> lock(mutex_);
  *out_ << "[" << level << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, PolicyDecisionEvent>) {
          log_line("INFO", "policy.decision tool=" + evt.tool + " outcome=" + evt.outcome +
                               " reason=" + evt.reason);
        } else if constexpr (std::is_same_v<T, RiskMatchEvent>) {
          log_line("INFO", "risk.match tool=" + evt.tool + " level=" + evt.level +
                               " label=" + evt.label);
        } else if constexpr (std::is_same_v<T, NetworkRequestEvent>) {
          const std::string targets =
              evt.targets.empty() ? std::string("(unknown destination)")
                                  : common::join(evt.targets, ",");
          log_line(evt.exfiltration ? "WARN" : "INFO",
                   "network.request tool=" + evt.tool + " targets=" + targets +
                       (evt.exfiltration ? " exfiltration=" + evt.reason : std::string()));
        } else if constexpr (std::is_same_v<T, SettingsEvent>) {
          log_line("DEBUG", "settings." + evt.action + " " + evt.detail);
        } else if constexpr (std::is_same_v<T, WarningEvent>) {
          log_line("WARN", evt.component + ": " + evt.message);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, FlushLatencyMetric>) {
          log_line("DEBUG", "metric.flush_latency_ms=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, PendingWritesMetric>) {
          log_line("DEBUG", "metric.pending_writes=" + std::to_string(m.depth));
        }
      },
      metric);
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  out_->flush();
}

} // namespace toolguard::observability
