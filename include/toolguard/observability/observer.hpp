#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace toolguard::observability {

struct PolicyDecisionEvent {
  std::string tool;
  std::string outcome;
  std::string reason;
};

struct RiskMatchEvent {
  std::string tool;
  std::string level;
  std::string label;
};

struct NetworkRequestEvent {
  std::string tool;
  std::vector<std::string> targets;
  bool exfiltration = false;
  std::string reason;
};

struct SettingsEvent {
  std::string action;
  std::string detail;
};

struct WarningEvent {
  std::string component;
  std::string message;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<PolicyDecisionEvent, RiskMatchEvent, NetworkRequestEvent,
                                   SettingsEvent, WarningEvent, ErrorEvent>;

struct FlushLatencyMetric {
  std::chrono::milliseconds latency{0};
};

struct PendingWritesMetric {
  std::uint64_t depth = 0;
};

using ObserverMetric = std::variant<FlushLatencyMetric, PendingWritesMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace toolguard::observability
