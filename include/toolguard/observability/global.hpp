#pragma once

#include "toolguard/observability/observer.hpp"

#include <memory>

namespace toolguard::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_policy_decision(const std::string &tool, const std::string &outcome,
                            const std::string &reason);
void record_risk_match(const std::string &tool, const std::string &level,
                       const std::string &label);
void record_network_request(const std::string &tool, const std::vector<std::string> &targets,
                            bool exfiltration, const std::string &reason);
void record_settings(const std::string &action, const std::string &detail);
void record_warning(const std::string &component, const std::string &message);
void record_error(const std::string &component, const std::string &message);

} // namespace toolguard::observability
