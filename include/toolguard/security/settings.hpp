#pragma once

#include "toolguard/common/result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace toolguard::security {

struct SecuritySettings {
  bool auto_deny_privilege_escalation = true;
  bool auto_deny_critical = true;
  bool require_type_to_critical = true;
  std::vector<std::string> command_allowlist;
  std::vector<std::string> command_denylist;
  /// Unix milliseconds. Read it through SessionOverride::remaining(), which expires it.
  std::optional<std::int64_t> session_override_until;
  int token_rotation_interval_days = 0;
  bool read_only_projects = false;

  bool operator==(const SecuritySettings &) const = default;
};

/// Built-in defaults, including the stock allowlist of common CLI tools.
[[nodiscard]] SecuritySettings default_security_settings();

/// JSON document with camelCase keys, as kept by the durable store.
[[nodiscard]] std::string settings_to_json(const SecuritySettings &settings);

/// Decode over the defaults: missing or wrongly typed fields keep their default.
/// Fails only when the text is not a JSON object.
[[nodiscard]] common::Result<SecuritySettings> settings_from_json(const std::string &json);

/// One pattern per line, trimmed, blank lines dropped.
[[nodiscard]] std::vector<std::string> parse_pattern_lines(const std::string &text);

/// Every problem found in the pattern lists and numeric fields, one message each.
[[nodiscard]] common::Result<std::vector<std::string>>
validate_settings(const SecuritySettings &settings);

} // namespace toolguard::security
