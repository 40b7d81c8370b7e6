#include "toolguard/security/command_policy.hpp"

#include "toolguard/security/safe_regex.hpp"

#include <algorithm>

namespace toolguard::security {

namespace {

bool any_pattern_matches(const std::string &command, const std::vector<std::string> &patterns) {
  return std::any_of(patterns.begin(), patterns.end(), [&command](const std::string &pattern) {
    return safe_regex_test(pattern, command);
  });
}

} // namespace

bool matches_allowlist(const std::string &command, const std::vector<std::string> &patterns) {
  return any_pattern_matches(command, patterns);
}

bool matches_denylist(const std::string &command, const std::vector<std::string> &patterns) {
  return any_pattern_matches(command, patterns);
}

std::string extract_command_string(const std::string &tool_name, const ToolArgs &args,
                                   const ToolCallOptions &options) {
  if (!is_exec_tool(tool_name, options)) {
    return tool_name;
  }

  std::string command;
  for (const auto &[key, value] : args) {
    (void)key;
    if (!value.is_string()) {
      continue;
    }
    if (!command.empty()) {
      command.push_back(' ');
    }
    command += value.scalar;
  }
  return command;
}

} // namespace toolguard::security
