#pragma once

#include "toolguard/security/tool_call.hpp"

#include <optional>
#include <string>
#include <vector>

namespace toolguard::security {

struct NetworkAuditResult {
  bool is_network_request = false;
  /// URLs and host:port pairs found in the call, in order of appearance, deduplicated.
  std::vector<std::string> targets;
  bool is_exfiltration = false;
  /// Source text of the first exfiltration shape that matched.
  std::optional<std::string> exfiltration_reason;
  /// True only when there is at least one target and every target is loopback.
  bool all_targets_local = false;
};

[[nodiscard]] NetworkAuditResult audit_network_request(const std::string &tool_name,
                                                       const ToolArgs &args,
                                                       const ToolCallOptions &options = {});

/// Host part of a URL or host:port target, lower-cased, brackets kept for IPv6.
[[nodiscard]] std::string target_host(const std::string &target);

[[nodiscard]] bool is_local_host(const std::string &host);

} // namespace toolguard::security
