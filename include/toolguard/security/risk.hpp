#pragma once

#include "toolguard/common/result.hpp"
#include "toolguard/security/tool_call.hpp"

#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace toolguard::security {

/// Ordinal severity. Only Critical, High and Medium appear in the danger table.
enum class RiskLevel { Critical, High, Medium, Low, Safe };

[[nodiscard]] std::string_view risk_level_to_string(RiskLevel level);
[[nodiscard]] common::Result<RiskLevel> risk_level_from_string(const std::string &value);

struct RiskClassification {
  RiskLevel level = RiskLevel::Safe;
  std::string label;
  std::string reason;
  /// Source text of the rule that fired.
  std::string matched_pattern;
};

struct DangerPattern {
  std::string source;
  RiskLevel level;
  std::string label;
  std::string reason;
  std::regex regex;
};

/// The danger table in evaluation order. Position is precedence: the first entry that
/// matches decides the classification, whatever the levels of later entries.
[[nodiscard]] const std::vector<DangerPattern> &danger_patterns();

[[nodiscard]] std::optional<RiskClassification>
classify_command_risk(const std::string &tool_name, const ToolArgs &args,
                      const ToolCallOptions &options = {});

/// sudo / su / doas / pkexec / runas anywhere in the search string. Backs the
/// auto-deny-privilege-escalation toggle independently of the danger table.
[[nodiscard]] bool is_privilege_escalation(const std::string &tool_name, const ToolArgs &args,
                                           const ToolCallOptions &options = {});

} // namespace toolguard::security
