#pragma once

#include "toolguard/security/network_audit.hpp"
#include "toolguard/security/risk.hpp"
#include "toolguard/security/session_override.hpp"
#include "toolguard/security/settings_store.hpp"
#include "toolguard/security/tool_call.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace toolguard::security {

enum class GateOutcome { AutoApprove, AutoDeny, Prompt };

[[nodiscard]] std::string_view gate_outcome_to_string(GateOutcome outcome);

struct GateDecision {
  GateOutcome outcome = GateOutcome::Prompt;
  std::string reason;
  std::optional<RiskClassification> risk;
  NetworkAuditResult network;
  /// Command string the allow/deny lists were matched against.
  std::string command;
  /// The approver has to type a confirmation rather than click through.
  bool require_typed_confirmation = false;
};

/// Turns one tool call into the decision record an approval workflow acts on.
class ApprovalGate {
public:
  ApprovalGate(SettingsStore &store, SessionOverride &session_override,
               ToolCallOptions options = {});

  [[nodiscard]] GateDecision evaluate(const std::string &tool_name, const ToolArgs &args);

private:
  [[nodiscard]] GateDecision decide(const std::string &tool_name, const ToolArgs &args);

  SettingsStore &store_;
  SessionOverride &session_override_;
  ToolCallOptions options_;
};

} // namespace toolguard::security
