#include "toolguard/security/network_audit.hpp"

#include "toolguard/common/fs.hpp"

#include <algorithm>
#include <regex>

namespace toolguard::security {

namespace {

constexpr auto REGEX_FLAGS = std::regex::ECMAScript | std::regex::icase;

const char *const NETWORK_TOOL_PATTERN =
    R"(\b(curl|wget|fetch|web_fetch|web_read|web_browse|http_request|rest_api_call|webhook_send|nc|ncat|netcat|socat|telnet|ssh|scp|sftp|rsync|ftp)\b|/dev/(tcp|udp)/)";

const char *const URL_PATTERN = R"(\b(?:https?|ftp|wss?)://[^\s'"<>|;)]+)";

const char *const HOST_PORT_PATTERN =
    R"(\b(?:nc|ncat|netcat|telnet|socat)\s+(?:-\S+\s+)*([A-Za-z0-9._-]+)\s+(\d{1,5})\b)";

// Checked in order; the first hit becomes the exfiltration reason. Case-sensitive,
// since curl's -F/-T/-d upload flags differ from -f/-t/-D.
const char *const EXFILTRATION_PATTERNS[] = {
    R"(\b(cat|tar|zip|gzip|base64|head|tail|xxd|find|env|printenv)\b[^|]*\|\s*(curl|wget|nc|ncat|netcat|socat|ssh|telnet)\b)",
    R"(\bcurl\b.*\s(-d|--data(-binary|-raw|-urlencode)?|-F|--form|-T|--upload-file)(\s|=|$))",
    R"(\bwget\b.*\s--post-(data|file)\b)",
    R"(/dev/(tcp|udp)/)",
    R"(\bscp\s+(-\S+\s+)*[^\s:]+\s+([\w.-]+@)?[\w.-]+:)",
    R"(\brsync\s+(-\S+\s+)*[^\s:]+\s+([\w.-]+@)?[\w.-]+:)",
    R"(\b(nc|ncat|netcat)\b[^|]*<\s*\S)",
};

struct CompiledPattern {
  std::string source;
  std::regex regex;
};

const std::vector<CompiledPattern> &exfiltration_patterns() {
  static const std::vector<CompiledPattern> patterns = [] {
    std::vector<CompiledPattern> out;
    for (const char *source : EXFILTRATION_PATTERNS) {
      out.push_back(
          CompiledPattern{.source = source, .regex = std::regex(source, std::regex::ECMAScript)});
    }
    return out;
  }();
  return patterns;
}

void add_target(std::vector<std::string> &targets, std::string target) {
  if (std::find(targets.begin(), targets.end(), target) == targets.end()) {
    targets.push_back(std::move(target));
  }
}

std::vector<std::string> extract_targets(const std::string &search) {
  static const std::regex url_regex(URL_PATTERN, REGEX_FLAGS);
  static const std::regex host_port_regex(HOST_PORT_PATTERN, REGEX_FLAGS);

  std::vector<std::string> targets;
  for (auto it = std::sregex_iterator(search.begin(), search.end(), url_regex);
       it != std::sregex_iterator(); ++it) {
    add_target(targets, it->str());
  }
  for (auto it = std::sregex_iterator(search.begin(), search.end(), host_port_regex);
       it != std::sregex_iterator(); ++it) {
    add_target(targets, (*it)[1].str() + ":" + (*it)[2].str());
  }
  return targets;
}

} // namespace

std::string target_host(const std::string &target) {
  std::string rest = target;
  if (const auto scheme = rest.find("://"); scheme != std::string::npos) {
    rest = rest.substr(scheme + 3);
  }
  if (const auto end = rest.find_first_of("/?#"); end != std::string::npos) {
    rest = rest.substr(0, end);
  }
  if (const auto at = rest.rfind('@'); at != std::string::npos) {
    rest = rest.substr(at + 1);
  }

  if (!rest.empty() && rest.front() == '[') {
    const auto close = rest.find(']');
    return common::to_lower(close == std::string::npos ? rest : rest.substr(0, close + 1));
  }
  if (std::count(rest.begin(), rest.end(), ':') == 1) {
    rest = rest.substr(0, rest.find(':'));
  }
  return common::to_lower(rest);
}

bool is_local_host(const std::string &host) {
  const std::string value = common::to_lower(common::trim(host));
  if (value == "localhost" || value == "::1" || value == "[::1]" || value == "0.0.0.0") {
    return true;
  }
  if (common::starts_with(value, "127.")) {
    return true;
  }
  const std::string suffix = ".localhost";
  return value.size() > suffix.size() &&
         value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

NetworkAuditResult audit_network_request(const std::string &tool_name, const ToolArgs &args,
                                         const ToolCallOptions &options) {
  static const std::regex network_tool_regex(NETWORK_TOOL_PATTERN, REGEX_FLAGS);

  NetworkAuditResult result;
  const std::string search = build_search_string(tool_name, args, options);
  try {
    if (!std::regex_search(search, network_tool_regex)) {
      return result;
    }
    result.is_network_request = true;
    result.targets = extract_targets(search);

    for (const auto &pattern : exfiltration_patterns()) {
      if (std::regex_search(search, pattern.regex)) {
        result.is_exfiltration = true;
        result.exfiltration_reason = pattern.source;
        break;
      }
    }
  } catch (const std::regex_error &) {
    // Hit the regex complexity limit; report what was established so far.
    return result;
  }

  result.all_targets_local =
      !result.targets.empty() &&
      std::all_of(result.targets.begin(), result.targets.end(),
                  [](const std::string &target) { return is_local_host(target_host(target)); });
  return result;
}

} // namespace toolguard::security
