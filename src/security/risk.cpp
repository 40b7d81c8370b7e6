#include "toolguard/security/risk.hpp"

#include "toolguard/common/fs.hpp"

namespace toolguard::security {

namespace {

struct PatternRule {
  const char *source;
  RiskLevel level;
  const char *label;
  const char *reason;
};

// clang-format off
const PatternRule kPatternRules[] = {
    // Privilege escalation
    {R"(\bsudo\b)",           RiskLevel::Critical, "Privilege Escalation", "Uses sudo to run commands as root"},
    {R"(\bsu\s+(-|root|\w))", RiskLevel::Critical, "Privilege Escalation", "Switches to another user (su)"},
    {R"(\bdoas\b)",           RiskLevel::Critical, "Privilege Escalation", "Uses doas to run commands as root"},
    {R"(\bpkexec\b)",         RiskLevel::Critical, "Privilege Escalation", "Uses pkexec for privilege escalation"},
    {R"(\brunas\b)",          RiskLevel::Critical, "Privilege Escalation", "Uses runas to run as another user"},

    // Destructive deletion
    {R"(\brm\s+(-[a-zA-Z]*f[a-zA-Z]*\s+(-[a-zA-Z]*r[a-zA-Z]*\s+)?|(-[a-zA-Z]*r[a-zA-Z]*\s+(-[a-zA-Z]*f[a-zA-Z]*\s+)?))[/"'~*])",
                              RiskLevel::Critical, "Destructive Deletion", "Recursive forced deletion targeting root, home, or wildcard paths"},
    {R"(\brm\s+-rf\s*/)",     RiskLevel::Critical, "Destructive Deletion", "rm -rf / destroys the entire filesystem"},
    {R"(\brm\s+-rf\s+~)",     RiskLevel::Critical, "Destructive Deletion", "rm -rf ~ destroys the home directory"},
    {R"(\bshred\b)",          RiskLevel::Critical, "Destructive Deletion", "shred irrecoverably overwrites files"},
    {R"(\bfind\b.*\s-delete\b)",
                              RiskLevel::Critical, "Destructive Deletion", "find -delete removes every matching file"},

    // Disk destruction
    {R"(\bdd\s+if=)",         RiskLevel::Critical, "Disk Write",           "dd can overwrite disk partitions or devices"},
    {R"(\bmkfs\b)",           RiskLevel::Critical, "Disk Format",          "mkfs formats a disk partition"},
    {R"(\bfdisk\b)",          RiskLevel::Critical, "Disk Partition",       "fdisk modifies disk partitions"},
    {R"(\bwipefs\b)",         RiskLevel::Critical, "Disk Wipe",            "wipefs erases filesystem signatures"},
    {R"(>\s*/dev/(sd|nvme|hd|disk))",
                              RiskLevel::Critical, "Device Write",         "Writing directly to a block device"},

    // Fork bomb
    {R"(:\(\)\s*\{.*\|.*&\s*\}\s*;?\s*:)",
                              RiskLevel::Critical, "Fork Bomb",            "Shell fork bomb, will exhaust the process table"},

    // Remote code execution
    {R"(\bcurl\b.*\|\s*(ba|z)?sh\b)",  RiskLevel::Critical, "Remote Code Exec", "Downloads and executes a remote script (curl | sh)"},
    {R"(\bwget\b.*\|\s*(ba|z)?sh\b)",  RiskLevel::Critical, "Remote Code Exec", "Downloads and executes a remote script (wget | sh)"},
    {R"(\bcurl\b.*\|\s*python)",       RiskLevel::Critical, "Remote Code Exec", "Downloads and pipes to a python interpreter"},
    {R"(\bwget\b.*\|\s*python)",       RiskLevel::Critical, "Remote Code Exec", "Downloads and pipes to a python interpreter"},
    {R"(\bbase64\s+(-d|--decode)\b.*\|\s*(ba|z)?sh\b)",
                                       RiskLevel::Critical, "Remote Code Exec", "Decodes and executes an obfuscated script"},

    // Firewall / network security
    {R"(\biptables\s+-F)",    RiskLevel::High, "Firewall Flush",      "Flushes all iptables firewall rules"},
    {R"(\bufw\s+disable)",    RiskLevel::High, "Firewall Disable",    "Disables the UFW firewall"},
    {R"(\bfirewalld?\b.*stop)", RiskLevel::High, "Firewall Stop",     "Stops the firewall daemon"},

    // User / account modification
    {R"(\bpasswd\b)",         RiskLevel::High, "Password Change",     "Modifies user passwords"},
    {R"(\bchpasswd\b)",       RiskLevel::High, "Password Change",     "Batch modifies user passwords"},
    {R"(\busermod\b)",        RiskLevel::High, "User Modification",   "Modifies user account properties"},
    {R"(\buseradd\b)",        RiskLevel::High, "User Creation",       "Creates a new user account"},
    {R"(\buserdel\b)",        RiskLevel::High, "User Deletion",       "Deletes a user account"},
    {R"(\bvisudo\b)",         RiskLevel::High, "Sudoers Edit",        "Edits the sudoers policy"},

    // Process killing
    {R"(\bkill\s+-9\s+1\b)",  RiskLevel::High, "Kill Init",           "Sends SIGKILL to PID 1 (init)"},
    {R"(\bkillall\b)",        RiskLevel::High, "Kill All Processes",  "Kills all processes matching a name"},
    {R"(\bpkill\s+-9\b)",     RiskLevel::High, "Kill Processes",      "Force-kills processes matching a pattern"},

    // Scheduled tasks
    {R"(\bcrontab\s+-r\b)",   RiskLevel::High, "Cron Wipe",           "Removes all crontab entries"},

    // SSH keys
    {R"(\bssh-keygen\b.*-f)", RiskLevel::High, "SSH Key Overwrite",   "May overwrite existing SSH keys"},

    // System state
    {R"(\b(shutdown|reboot|halt|poweroff)\b)",
                              RiskLevel::High, "System Shutdown",     "Shuts down or restarts the machine"},
    {R"(\bhistory\s+-c\b)",   RiskLevel::High, "History Wipe",        "Clears shell history"},

    // Destructive SQL
    {R"(\bdrop\s+(table|database|schema)\b)",
                              RiskLevel::High, "Destructive SQL",     "Drops a table, database or schema"},
    {R"(\btruncate\s+table\b)",
                              RiskLevel::High, "Destructive SQL",     "Deletes every row of a table"},
    {R"(\bdelete\s+from\s+[\w.`"\[\]]+\s*(;|$))",
                              RiskLevel::High, "Destructive SQL",     "DELETE without a WHERE clause removes every row"},

    // Permission changes
    {R"(\bchmod\s+(777|a\+rwx))", RiskLevel::Medium, "Permission Exposure",     "Sets world-readable/writable permissions (777)"},
    {R"(\bchmod\s+-R\s+777)",     RiskLevel::Medium, "Recursive Perm Exposure", "Recursively sets 777 permissions"},
    {R"(\bchown\b)",              RiskLevel::Medium, "Ownership Change",        "Changes file ownership"},

    // Eval
    {R"(\beval\s)",           RiskLevel::Medium, "Eval Execution",     "Evaluates a string as shell code"},

    // Services
    {R"(\bsystemctl\s+(stop|disable|mask))",
                              RiskLevel::Medium, "Service Modification", "Stops or disables a system service"},
    {R"(\bservice\s+\S+\s+stop)",
                              RiskLevel::Medium, "Service Stop",         "Stops a system service"},

    // Version control
    {R"(\bgit\s+push\b.*(\s--force\b|\s-f\b))",
                              RiskLevel::Medium, "Force Push",           "Rewrites remote git history"},
    {R"(\bgit\s+reset\s+--hard\b)",
                              RiskLevel::Medium, "Hard Reset",           "Discards uncommitted git changes"},
};
// clang-format on

const char *const PRIVILEGE_ESCALATION_PATTERN = R"(\b(sudo|doas|pkexec|runas)\b|\bsu\s+(-|\w))";

std::vector<DangerPattern> build_table() {
  std::vector<DangerPattern> table;
  table.reserve(std::size(kPatternRules));
  for (const auto &rule : kPatternRules) {
    table.push_back(DangerPattern{
        .source = rule.source,
        .level = rule.level,
        .label = rule.label,
        .reason = rule.reason,
        .regex = std::regex(rule.source, std::regex::ECMAScript | std::regex::icase |
                                             std::regex::optimize),
    });
  }
  return table;
}

} // namespace

std::string_view risk_level_to_string(const RiskLevel level) {
  switch (level) {
  case RiskLevel::Critical:
    return "critical";
  case RiskLevel::High:
    return "high";
  case RiskLevel::Medium:
    return "medium";
  case RiskLevel::Low:
    return "low";
  case RiskLevel::Safe:
    return "safe";
  }
  return "safe";
}

common::Result<RiskLevel> risk_level_from_string(const std::string &value) {
  const std::string normalized = common::to_lower(common::trim(value));
  if (normalized == "critical") {
    return common::Result<RiskLevel>::success(RiskLevel::Critical);
  }
  if (normalized == "high") {
    return common::Result<RiskLevel>::success(RiskLevel::High);
  }
  if (normalized == "medium") {
    return common::Result<RiskLevel>::success(RiskLevel::Medium);
  }
  if (normalized == "low") {
    return common::Result<RiskLevel>::success(RiskLevel::Low);
  }
  if (normalized == "safe") {
    return common::Result<RiskLevel>::success(RiskLevel::Safe);
  }
  return common::Result<RiskLevel>::failure("unknown RiskLevel: " + value);
}

const std::vector<DangerPattern> &danger_patterns() {
  static const std::vector<DangerPattern> table = build_table();
  return table;
}

std::optional<RiskClassification> classify_command_risk(const std::string &tool_name,
                                                        const ToolArgs &args,
                                                        const ToolCallOptions &options) {
  const std::string search = build_search_string(tool_name, args, options);
  if (common::trim(search).empty()) {
    return std::nullopt;
  }

  for (const auto &entry : danger_patterns()) {
    try {
      if (std::regex_search(search, entry.regex)) {
        return RiskClassification{
            .level = entry.level,
            .label = entry.label,
            .reason = entry.reason,
            .matched_pattern = entry.source,
        };
      }
    } catch (const std::regex_error &) {
      // A runaway match on one rule must not hide the rules after it.
      continue;
    }
  }
  return std::nullopt;
}

bool is_privilege_escalation(const std::string &tool_name, const ToolArgs &args,
                             const ToolCallOptions &options) {
  static const std::regex pattern(PRIVILEGE_ESCALATION_PATTERN,
                                  std::regex::ECMAScript | std::regex::icase);
  const std::string search = build_search_string(tool_name, args, options);
  if (common::trim(search).empty()) {
    return false;
  }
  try {
    return std::regex_search(search, pattern);
  } catch (const std::regex_error &) {
    return false;
  }
}

} // namespace toolguard::security
