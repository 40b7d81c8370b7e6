#pragma once

#include "toolguard/security/tool_call.hpp"

#include <string>
#include <vector>

namespace toolguard::security {

/// True when any pattern matches `command`. Patterns go through safe_regex_test, so
/// a risky or malformed entry simply does not match.
[[nodiscard]] bool matches_allowlist(const std::string &command,
                                     const std::vector<std::string> &patterns);
[[nodiscard]] bool matches_denylist(const std::string &command,
                                    const std::vector<std::string> &patterns);

/// Exec tools: every string argument joined with spaces. Other tools: the tool name.
[[nodiscard]] std::string extract_command_string(const std::string &tool_name,
                                                 const ToolArgs &args,
                                                 const ToolCallOptions &options = {});

} // namespace toolguard::security
