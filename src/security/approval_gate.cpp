#include "toolguard/security/approval_gate.hpp"

#include "toolguard/observability/global.hpp"
#include "toolguard/security/command_policy.hpp"
#include "toolguard/security/filesystem_write.hpp"

namespace toolguard::security {

std::string_view gate_outcome_to_string(const GateOutcome outcome) {
  switch (outcome) {
  case GateOutcome::AutoApprove:
    return "auto_approve";
  case GateOutcome::AutoDeny:
    return "auto_deny";
  case GateOutcome::Prompt:
    return "prompt";
  }
  return "prompt";
}

ApprovalGate::ApprovalGate(SettingsStore &store, SessionOverride &session_override,
                           ToolCallOptions options)
    : store_(store), session_override_(session_override), options_(std::move(options)) {}

GateDecision ApprovalGate::evaluate(const std::string &tool_name, const ToolArgs &args) {
  GateDecision decision = decide(tool_name, args);
  observability::record_policy_decision(
      tool_name, std::string(gate_outcome_to_string(decision.outcome)), decision.reason);
  return decision;
}

GateDecision ApprovalGate::decide(const std::string &tool_name, const ToolArgs &args) {
  GateDecision decision;
  decision.network = audit_network_request(tool_name, args, options_);
  if (decision.network.is_network_request) {
    observability::record_network_request(tool_name, decision.network.targets,
                                          decision.network.is_exfiltration,
                                          decision.network.exfiltration_reason.value_or(""));
  }

  decision.risk = classify_command_risk(tool_name, args, options_);
  if (decision.risk.has_value()) {
    observability::record_risk_match(tool_name,
                                     std::string(risk_level_to_string(decision.risk->level)),
                                     decision.risk->label);
  }
  decision.command = extract_command_string(tool_name, args, options_);

  const auto settings = store_.snapshot();
  const bool privileged = is_privilege_escalation(tool_name, args, options_);

  if (const auto remaining = session_override_.remaining(); remaining > 0) {
    if (!(settings->auto_deny_privilege_escalation && privileged)) {
      decision.outcome = GateOutcome::AutoApprove;
      decision.reason = "session override active (" + std::to_string(remaining / 1000) +
                        "s remaining)";
      return decision;
    }
  }

  if (settings->read_only_projects) {
    const auto write = classify_filesystem_write(tool_name, args, options_);
    if (write.is_write) {
      decision.outcome = GateOutcome::AutoDeny;
      decision.reason = "read-only project mode: filesystem write blocked";
      if (write.target_path.has_value()) {
        decision.reason += " (" + *write.target_path + ")";
      }
      return decision;
    }
  }

  if (settings->auto_deny_privilege_escalation && privileged) {
    decision.outcome = GateOutcome::AutoDeny;
    decision.reason = "privilege escalation auto-denied";
    return decision;
  }

  const bool critical = decision.risk.has_value() && decision.risk->level == RiskLevel::Critical;
  if (settings->auto_deny_critical && critical) {
    decision.outcome = GateOutcome::AutoDeny;
    decision.reason = "critical risk auto-denied: " + decision.risk->label;
    return decision;
  }

  if (!settings->command_denylist.empty() &&
      matches_denylist(decision.command, settings->command_denylist)) {
    decision.outcome = GateOutcome::AutoDeny;
    decision.reason = "matched command denylist";
    return decision;
  }

  if (!decision.risk.has_value() && !settings->command_allowlist.empty() &&
      matches_allowlist(decision.command, settings->command_allowlist)) {
    decision.outcome = GateOutcome::AutoApprove;
    decision.reason = "matched command allowlist";
    return decision;
  }

  decision.outcome = GateOutcome::Prompt;
  decision.require_typed_confirmation = settings->require_type_to_critical && critical;
  decision.reason = decision.risk.has_value()
                        ? std::string(risk_level_to_string(decision.risk->level)) + " risk: " +
                              decision.risk->reason
                        : "no policy rule applies";
  return decision;
}

} // namespace toolguard::security
