#include "toolguard/security/settings.hpp"

#include "toolguard/common/fs.hpp"
#include "toolguard/common/json_util.hpp"
#include "toolguard/security/safe_regex.hpp"

#include <charconv>
#include <limits>
#include <sstream>

namespace toolguard::security {

namespace {

// clang-format off
const char *const DEFAULT_ALLOWLIST[] = {
    // Version control
    R"(^git\b)", R"(^gh\b)", R"(^hg\b)", R"(^svn\b)",
    // JavaScript
    R"(^npm\b)", R"(^npx\b)", R"(^node\b)", R"(^yarn\b)", R"(^pnpm\b)", R"(^bun\b)",
    R"(^deno\b)", R"(^tsc\b)", R"(^eslint\b)", R"(^prettier\b)", R"(^jest\b)", R"(^vitest\b)",
    // Python
    R"(^python3?\b)", R"(^pip3?\b)", R"(^pipx\b)", R"(^poetry\b)", R"(^uv\b)",
    R"(^pytest\b)", R"(^ruff\b)", R"(^black\b)", R"(^mypy\b)", R"(^conda\b)",
    // Other toolchains
    R"(^cargo\b)", R"(^rustc\b)", R"(^rustup\b)", R"(^go\b)", R"(^gofmt\b)",
    R"(^java\b)", R"(^javac\b)", R"(^mvn\b)", R"(^gradle\b)", R"(^dotnet\b)",
    R"(^ruby\b)", R"(^gem\b)", R"(^bundle\b)", R"(^php\b)", R"(^composer\b)",
    R"(^make\b)", R"(^cmake\b)", R"(^ninja\b)", R"(^gcc\b)", R"(^g\+\+)", R"(^clang\b)",
    // Reading and listing
    R"(^ls\b)", R"(^cat\b)", R"(^less\b)", R"(^more\b)", R"(^head\b)", R"(^tail\b)",
    R"(^wc\b)", R"(^tree\b)", R"(^file\b)", R"(^stat\b)", R"(^du\b)", R"(^df\b)",
    R"(^pwd$)", R"(^echo\b)", R"(^printf\b)", R"(^which\b)", R"(^whereis\b)", R"(^type\b)",
    R"(^realpath\b)", R"(^dirname\b)", R"(^basename\b)", R"(^readlink\b)",
    // Searching and text processing
    R"(^find\b)", R"(^grep\b)", R"(^egrep\b)", R"(^rg\b)", R"(^ag\b)", R"(^fd\b)",
    R"(^awk\b)", R"(^sort\b)", R"(^uniq\b)", R"(^cut\b)", R"(^tr\b)", R"(^diff\b)",
    R"(^cmp\b)", R"(^comm\b)", R"(^jq\b)", R"(^yq\b)", R"(^xxd\b)", R"(^hexdump\b)",
    R"(^od\b)", R"(^strings\b)", R"(^column\b)", R"(^nl\b)", R"(^fold\b)", R"(^paste\b)",
    // Hashing and archives
    R"(^md5sum\b)", R"(^sha1sum\b)", R"(^sha256sum\b)", R"(^shasum\b)", R"(^base64\b)",
    R"(^tar\s+-?t)", R"(^unzip\s+-l\b)", R"(^zcat\b)",
    // System information
    R"(^date\b)", R"(^cal\b)", R"(^uptime\b)", R"(^whoami$)", R"(^id\b)", R"(^hostname$)",
    R"(^uname\b)", R"(^env$)", R"(^printenv\b)", R"(^ps\b)", R"(^top\s+-b)", R"(^free\b)",
    R"(^lscpu\b)", R"(^nproc\b)", R"(^sw_vers\b)", R"(^locale\b)",
    // Containers (read-only verbs)
    R"(^docker\s+(ps|images|logs|inspect|version|info)\b)",
    R"(^kubectl\s+(get|describe|logs|version)\b)",
    // Misc
    R"(^true$)", R"(^false$)", R"(^sleep\b)", R"(^test\b)", R"(^seq\b)", R"(^man\b)",
    R"(^tldr\b)", R"(^code\b)",
};
// clang-format on

std::string bool_json(const bool value) { return value ? "true" : "false"; }

std::optional<bool> decode_bool(const std::string &raw) {
  if (raw == "true") {
    return true;
  }
  if (raw == "false") {
    return false;
  }
  return std::nullopt;
}

template <typename Int> std::optional<Int> decode_int(const std::string &raw) {
  Int value{};
  const char *begin = raw.data();
  const char *end = raw.data() + raw.size();
  const auto [ptr, ec] = std::from_chars(begin, end, value);
  if (ec != std::errc() || ptr != end) {
    return std::nullopt;
  }
  return value;
}

std::optional<std::vector<std::string>> decode_list(const std::string &raw) {
  if (raw.empty() || raw.front() != '[') {
    return std::nullopt;
  }
  auto parsed = common::json_parse_string_array(raw);
  if (!parsed.ok()) {
    return std::nullopt;
  }
  return std::move(parsed.value());
}

void check_patterns(const std::string &list_name, const std::vector<std::string> &patterns,
                    std::vector<std::string> &problems) {
  for (const auto &pattern : patterns) {
    if (common::trim(pattern).empty()) {
      problems.push_back(list_name + ": empty pattern");
      continue;
    }
    if (const auto message = validate_regex_pattern(pattern); message.has_value()) {
      problems.push_back(list_name + ": " + pattern + ": " + *message);
    }
  }
}

} // namespace

SecuritySettings default_security_settings() {
  SecuritySettings settings;
  settings.command_allowlist.assign(std::begin(DEFAULT_ALLOWLIST), std::end(DEFAULT_ALLOWLIST));
  return settings;
}

std::string settings_to_json(const SecuritySettings &settings) {
  std::ostringstream out;
  out << "{";
  out << "\"autoDenyPrivilegeEscalation\":" << bool_json(settings.auto_deny_privilege_escalation);
  out << ",\"autoDenyCritical\":" << bool_json(settings.auto_deny_critical);
  out << ",\"requireTypeToCritical\":" << bool_json(settings.require_type_to_critical);
  out << ",\"commandAllowlist\":" << common::json_string_array(settings.command_allowlist);
  out << ",\"commandDenylist\":" << common::json_string_array(settings.command_denylist);
  out << ",\"sessionOverrideUntil\":";
  if (settings.session_override_until.has_value()) {
    out << *settings.session_override_until;
  } else {
    out << "null";
  }
  out << ",\"tokenRotationIntervalDays\":" << settings.token_rotation_interval_days;
  out << ",\"readOnlyProjects\":" << bool_json(settings.read_only_projects);
  out << "}";
  return out.str();
}

common::Result<SecuritySettings> settings_from_json(const std::string &json) {
  const auto parsed = common::json_parse_flat(json);
  if (!parsed.ok()) {
    return common::Result<SecuritySettings>::failure("invalid settings document: " +
                                                     parsed.error());
  }
  const auto &fields = parsed.value();
  SecuritySettings settings = default_security_settings();

  const auto field = [&fields](const char *name) -> const std::string * {
    const auto it = fields.find(name);
    return it == fields.end() ? nullptr : &it->second;
  };
  const auto read_bool = [&field](const char *name, bool &target) {
    if (const auto *raw = field(name)) {
      if (const auto value = decode_bool(*raw)) {
        target = *value;
      }
    }
  };
  const auto read_list = [&field](const char *name, std::vector<std::string> &target) {
    if (const auto *raw = field(name)) {
      if (auto value = decode_list(*raw)) {
        target = std::move(*value);
      }
    }
  };

  read_bool("autoDenyPrivilegeEscalation", settings.auto_deny_privilege_escalation);
  read_bool("autoDenyCritical", settings.auto_deny_critical);
  read_bool("requireTypeToCritical", settings.require_type_to_critical);
  read_bool("readOnlyProjects", settings.read_only_projects);
  read_list("commandAllowlist", settings.command_allowlist);
  read_list("commandDenylist", settings.command_denylist);

  if (const auto *raw = field("sessionOverrideUntil")) {
    if (*raw == "null") {
      settings.session_override_until.reset();
    } else if (const auto value = decode_int<std::int64_t>(*raw)) {
      settings.session_override_until = *value;
    }
  }
  if (const auto *raw = field("tokenRotationIntervalDays")) {
    if (const auto value = decode_int<int>(*raw)) {
      settings.token_rotation_interval_days = *value;
    }
  }

  return common::Result<SecuritySettings>::success(std::move(settings));
}

std::vector<std::string> parse_pattern_lines(const std::string &text) {
  std::vector<std::string> patterns;
  for (const auto &line : common::split_lines(text)) {
    std::string trimmed = common::trim(line);
    if (!trimmed.empty()) {
      patterns.push_back(std::move(trimmed));
    }
  }
  return patterns;
}

common::Result<std::vector<std::string>> validate_settings(const SecuritySettings &settings) {
  std::vector<std::string> problems;
  check_patterns("commandAllowlist", settings.command_allowlist, problems);
  check_patterns("commandDenylist", settings.command_denylist, problems);
  if (settings.token_rotation_interval_days < 0) {
    problems.push_back("tokenRotationIntervalDays: must be >= 0, got " +
                       std::to_string(settings.token_rotation_interval_days));
  }
  if (settings.session_override_until.has_value() && *settings.session_override_until < 0) {
    problems.push_back("sessionOverrideUntil: must be a unix timestamp in milliseconds");
  }
  return common::Result<std::vector<std::string>>::success(std::move(problems));
}

} // namespace toolguard::security
