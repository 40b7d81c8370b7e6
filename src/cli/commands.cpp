#include "toolguard/cli/commands.hpp"

#include "toolguard/common/fs.hpp"
#include "toolguard/common/json_util.hpp"
#include "toolguard/config/config.hpp"
#include "toolguard/observability/factory.hpp"
#include "toolguard/observability/global.hpp"
#include "toolguard/security/approval_gate.hpp"
#include "toolguard/security/command_policy.hpp"
#include "toolguard/security/filesystem_write.hpp"
#include "toolguard/security/network_audit.hpp"
#include "toolguard/security/risk.hpp"
#include "toolguard/security/safe_regex.hpp"
#include "toolguard/security/secrets.hpp"
#include "toolguard/security/session_override.hpp"
#include "toolguard/security/settings_store.hpp"
#include "toolguard/security/sqlite_settings_store.hpp"

#include <algorithm>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace toolguard::cli {

namespace {

constexpr int EXIT_DENIED = 2;
constexpr int EXIT_PROMPT = 3;
constexpr auto FLUSH_TIMEOUT = std::chrono::seconds(5);

std::string version_string() {
#ifdef TOOLGUARD_VERSION
  std::string version = TOOLGUARD_VERSION;
#else
  std::string version = "0.1.0";
#endif
  return "toolguard " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::optional<bool> parse_bool(const std::string &raw) {
  const std::string value = common::to_lower(common::trim(raw));
  if (value == "true" || value == "on" || value == "yes" || value == "1") {
    return true;
  }
  if (value == "false" || value == "off" || value == "no" || value == "0") {
    return false;
  }
  return std::nullopt;
}

std::optional<std::int64_t> parse_int(const std::string &raw) {
  const std::string value = common::trim(raw);
  std::int64_t parsed = 0;
  const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
  if (value.empty() || ec != std::errc() || ptr != value.data() + value.size()) {
    return std::nullopt;
  }
  return parsed;
}

/// Everything a command needs once config and storage are wired up.
struct Runtime {
  config::Config config;
  security::ToolCallOptions options;
  std::unique_ptr<security::SettingsStore> store;
  std::unique_ptr<security::SessionOverride> session_override;

  ~Runtime() {
    if (store && !store->wait_idle(FLUSH_TIMEOUT)) {
      std::cerr << "warning: settings were not persisted before exit\n";
    }
  }
};

std::shared_ptr<security::IDurableSettingsStore> open_durable_store(const config::Config &cfg) {
  const auto key = security::load_or_create_key(common::expand_path(cfg.storage.key_path));
  if (!key.ok()) {
    observability::record_error("storage", "settings key unavailable: " + key.error());
    return nullptr;
  }
  auto store = std::make_shared<security::SqliteSettingsStore>(
      common::expand_path(cfg.storage.database_path), key.value());
  if (!store->open_error().empty()) {
    observability::record_error("storage", "settings database unavailable: " + store->open_error());
  }
  return store;
}

std::unique_ptr<Runtime> make_runtime(std::string &error) {
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    error = cfg.error();
    return nullptr;
  }

  auto runtime = std::make_unique<Runtime>();
  runtime->config = std::move(cfg.value());
  observability::set_global_observer(observability::create_observer(runtime->config));

  runtime->options.exec_tools = runtime->config.engine.exec_tools;
  runtime->options.max_search_length =
      static_cast<std::size_t>(runtime->config.engine.max_search_length);

  std::shared_ptr<security::ILegacySettingsSource> legacy;
  if (!common::trim(runtime->config.storage.legacy_settings_path).empty()) {
    legacy = std::make_shared<security::LegacySettingsFile>(
        common::expand_path(runtime->config.storage.legacy_settings_path));
  }
  runtime->store = std::make_unique<security::SettingsStore>(
      open_durable_store(runtime->config), std::move(legacy));
  runtime->store->init();
  runtime->session_override = std::make_unique<security::SessionOverride>(*runtime->store);
  return runtime;
}

security::ToolArgs args_from_cli(const std::vector<std::string> &args) {
  if (args.size() < 2) {
    return {};
  }
  auto parsed = security::parse_tool_args(args[1]);
  if (!parsed.ok()) {
    std::cerr << "warning: ignoring arguments: " << parsed.error() << "\n";
    return {};
  }
  return std::move(parsed.value());
}

std::string risk_json(const std::optional<security::RiskClassification> &risk) {
  if (!risk.has_value()) {
    return "null";
  }
  std::ostringstream out;
  out << "{\"level\":" << common::json_quote(std::string(security::risk_level_to_string(risk->level)))
      << ",\"label\":" << common::json_quote(risk->label)
      << ",\"reason\":" << common::json_quote(risk->reason)
      << ",\"matchedPattern\":" << common::json_quote(risk->matched_pattern) << "}";
  return out.str();
}

std::string network_json(const security::NetworkAuditResult &audit) {
  std::ostringstream out;
  out << "{\"isNetworkRequest\":" << (audit.is_network_request ? "true" : "false")
      << ",\"targets\":" << common::json_string_array(audit.targets)
      << ",\"isExfiltration\":" << (audit.is_exfiltration ? "true" : "false")
      << ",\"exfiltrationReason\":"
      << (audit.exfiltration_reason.has_value() ? common::json_quote(*audit.exfiltration_reason)
                                                : "null")
      << ",\"allTargetsLocal\":" << (audit.all_targets_local ? "true" : "false") << "}";
  return out.str();
}

std::string write_json(const security::FilesystemWriteResult &write) {
  std::ostringstream out;
  out << "{\"isWrite\":" << (write.is_write ? "true" : "false") << ",\"targetPath\":"
      << (write.target_path.has_value() ? common::json_quote(*write.target_path) : "null")
      << "}";
  return out.str();
}

void print_risk(const std::optional<security::RiskClassification> &risk) {
  if (!risk.has_value()) {
    std::cout << "safe\n";
    return;
  }
  std::cout << security::risk_level_to_string(risk->level) << "  " << risk->label << "\n"
            << "  reason:  " << risk->reason << "\n"
            << "  pattern: " << risk->matched_pattern << "\n";
}

int run_classify(std::vector<std::string> args) {
  const bool json = take_flag(args, "--json");
  if (args.empty()) {
    std::cerr << "usage: toolguard classify <tool> [args-json] [--json]\n";
    return 1;
  }
  const auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }
  security::ToolCallOptions options{
      .exec_tools = cfg.value().engine.exec_tools,
      .max_search_length = static_cast<std::size_t>(cfg.value().engine.max_search_length)};

  const auto tool_args = args_from_cli(args);
  const auto risk = security::classify_command_risk(args[0], tool_args, options);
  if (json) {
    std::cout << "{\"risk\":" << risk_json(risk) << ",\"privilegeEscalation\":"
              << (security::is_privilege_escalation(args[0], tool_args, options) ? "true"
                                                                                  : "false")
              << ",\"command\":"
              << common::json_quote(security::extract_command_string(args[0], tool_args, options))
              << "}\n";
    return 0;
  }
  print_risk(risk);
  return 0;
}

int run_audit(std::vector<std::string> args) {
  const bool json = take_flag(args, "--json");
  if (args.empty()) {
    std::cerr << "usage: toolguard audit <tool> [args-json] [--json]\n";
    return 1;
  }
  const auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }
  security::ToolCallOptions options{
      .exec_tools = cfg.value().engine.exec_tools,
      .max_search_length = static_cast<std::size_t>(cfg.value().engine.max_search_length)};

  const auto tool_args = args_from_cli(args);
  const auto network = security::audit_network_request(args[0], tool_args, options);
  const auto write = security::classify_filesystem_write(args[0], tool_args, options);
  if (json) {
    std::cout << "{\"network\":" << network_json(network) << ",\"filesystem\":"
              << write_json(write) << "}\n";
    return 0;
  }

  std::cout << "network:    " << (network.is_network_request ? "yes" : "no") << "\n";
  if (network.is_network_request) {
    std::cout << "  targets:  "
              << (network.targets.empty() ? "(unknown destination)"
                                          : common::join(network.targets, ", "))
              << "\n";
    std::cout << "  local:    " << (network.all_targets_local ? "yes" : "no") << "\n";
    if (network.is_exfiltration) {
      std::cout << "  exfiltration suspected: " << *network.exfiltration_reason << "\n";
    }
  }
  std::cout << "filesystem: " << (write.is_write ? "write" : "no write");
  if (write.target_path.has_value()) {
    std::cout << " (" << *write.target_path << ")";
  }
  std::cout << "\n";
  return 0;
}

int run_check(std::vector<std::string> args) {
  const bool json = take_flag(args, "--json");
  if (args.empty()) {
    std::cerr << "usage: toolguard check <tool> [args-json] [--json]\n";
    return 1;
  }
  std::string error;
  auto runtime = make_runtime(error);
  if (!runtime) {
    std::cerr << error << "\n";
    return 1;
  }

  security::ApprovalGate gate(*runtime->store, *runtime->session_override, runtime->options);
  const auto decision = gate.evaluate(args[0], args_from_cli(args));
  const std::string outcome(security::gate_outcome_to_string(decision.outcome));

  if (json) {
    std::cout << "{\"outcome\":" << common::json_quote(outcome)
              << ",\"reason\":" << common::json_quote(decision.reason)
              << ",\"command\":" << common::json_quote(decision.command)
              << ",\"requireTypedConfirmation\":"
              << (decision.require_typed_confirmation ? "true" : "false")
              << ",\"risk\":" << risk_json(decision.risk)
              << ",\"network\":" << network_json(decision.network) << "}\n";
  } else {
    std::cout << outcome << ": " << decision.reason << "\n";
    if (decision.require_typed_confirmation) {
      std::cout << "  typed confirmation required\n";
    }
  }

  switch (decision.outcome) {
  case security::GateOutcome::AutoApprove:
    return 0;
  case security::GateOutcome::AutoDeny:
    return EXIT_DENIED;
  case security::GateOutcome::Prompt:
    return EXIT_PROMPT;
  }
  return EXIT_PROMPT;
}

int run_validate_pattern(const std::vector<std::string> &args) {
  if (args.empty()) {
    std::cerr << "usage: toolguard validate-pattern <regex>\n";
    return 1;
  }
  const auto message = security::validate_regex_pattern(args[0]);
  if (message.has_value()) {
    std::cout << *message << "\n";
    return 1;
  }
  std::cout << "ok\n";
  return 0;
}

bool apply_setting(security::SecuritySettings &settings, const std::string &key,
                   const std::string &value, std::string &error) {
  const auto set_bool = [&](bool &target) {
    const auto parsed = parse_bool(value);
    if (!parsed.has_value()) {
      error = "expected true or false for " + key;
      return false;
    }
    target = *parsed;
    return true;
  };

  if (key == "autoDenyPrivilegeEscalation") {
    return set_bool(settings.auto_deny_privilege_escalation);
  }
  if (key == "autoDenyCritical") {
    return set_bool(settings.auto_deny_critical);
  }
  if (key == "requireTypeToCritical") {
    return set_bool(settings.require_type_to_critical);
  }
  if (key == "readOnlyProjects") {
    return set_bool(settings.read_only_projects);
  }
  if (key == "tokenRotationIntervalDays") {
    const auto parsed = parse_int(value);
    if (!parsed.has_value() || *parsed < 0 || *parsed > 3650) {
      error = "tokenRotationIntervalDays must be a whole number of days between 0 and 3650";
      return false;
    }
    settings.token_rotation_interval_days = static_cast<int>(*parsed);
    return true;
  }
  if (key == "commandAllowlist") {
    settings.command_allowlist = security::parse_pattern_lines(value);
    return true;
  }
  if (key == "commandDenylist") {
    settings.command_denylist = security::parse_pattern_lines(value);
    return true;
  }
  error = "unknown setting: " + key;
  return false;
}

int run_settings(std::vector<std::string> args) {
  std::string error;
  auto runtime = make_runtime(error);
  if (!runtime) {
    std::cerr << error << "\n";
    return 1;
  }
  auto &store = *runtime->store;

  if (args.empty() || args[0] == "show") {
    std::cout << security::settings_to_json(store.load()) << "\n";
    return 0;
  }
  if (args[0] == "reset") {
    store.reset();
    std::cout << "security settings reset to defaults\n";
    return 0;
  }
  if (args[0] == "validate") {
    const auto problems = security::validate_settings(store.load());
    if (!problems.ok()) {
      std::cerr << problems.error() << "\n";
      return 1;
    }
    for (const auto &problem : problems.value()) {
      std::cout << problem << "\n";
    }
    if (problems.value().empty()) {
      std::cout << "ok\n";
      return 0;
    }
    return 1;
  }
  if (args[0] == "allow" || args[0] == "deny") {
    if (args.size() < 2) {
      std::cerr << "usage: toolguard settings " << args[0] << " <pattern>\n";
      return 1;
    }
    const std::string pattern = common::trim(args[1]);
    if (const auto message = security::validate_regex_pattern(pattern); message.has_value()) {
      std::cerr << "invalid pattern: " << *message << "\n";
      return 1;
    }
    const bool allow = args[0] == "allow";
    store.update([&](security::SecuritySettings &settings) {
      auto &list = allow ? settings.command_allowlist : settings.command_denylist;
      if (std::find(list.begin(), list.end(), pattern) == list.end()) {
        list.push_back(pattern);
      }
    });
    return 0;
  }
  if (args[0] == "set") {
    if (args.size() < 3) {
      std::cerr << "usage: toolguard settings set <key> <value>\n";
      return 1;
    }
    auto settings = store.load();
    if (!apply_setting(settings, args[1], args[2], error)) {
      std::cerr << error << "\n";
      return 1;
    }
    const auto problems = security::validate_settings(settings);
    if (!problems.ok() || !problems.value().empty()) {
      std::cerr << (problems.ok() ? common::join(problems.value(), "\n") : problems.error())
                << "\n";
      return 1;
    }
    store.save(settings);
    return 0;
  }

  std::cerr << "unknown settings command\n";
  return 1;
}

int run_override(std::vector<std::string> args) {
  std::string error;
  auto runtime = make_runtime(error);
  if (!runtime) {
    std::cerr << error << "\n";
    return 1;
  }
  auto &session_override = *runtime->session_override;

  if (args.empty() || args[0] == "status") {
    const auto remaining = session_override.remaining();
    if (remaining <= 0) {
      std::cout << "inactive\n";
    } else {
      std::cout << "active, " << (remaining + 59'999) / 60'000 << " min remaining\n";
    }
    return 0;
  }
  if (args[0] == "activate") {
    std::optional<std::int64_t> minutes;
    if (args.size() >= 2) {
      minutes = parse_int(args[1]);
    }
    if (!minutes.has_value()) {
      std::cerr << "usage: toolguard override activate <minutes>\n";
      return 1;
    }
    if (const auto activated = session_override.activate(*minutes); !activated.ok()) {
      std::cerr << activated.error() << "\n";
      return 1;
    }
    std::cout << (*minutes > 0 ? "session override active for " + std::to_string(*minutes) +
                                     " min"
                               : std::string("session override cleared"))
              << "\n";
    return 0;
  }
  if (args[0] == "clear") {
    session_override.clear();
    std::cout << "session override cleared\n";
    return 0;
  }

  std::cerr << "unknown override command\n";
  return 1;
}

int run_config(std::vector<std::string> args) {
  if (!args.empty() && args[0] == "path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      std::cerr << path_result.error() << "\n";
      return 1;
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }

  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }

  if (args.empty() || args[0] == "show") {
    std::cout << config::render_config(cfg.value());
    return 0;
  }
  if (args[0] == "validate") {
    const auto problems = config::validate_config(cfg.value());
    if (!problems.ok()) {
      std::cerr << problems.error() << "\n";
      return 1;
    }
    for (const auto &problem : problems.value()) {
      std::cout << problem << "\n";
    }
    if (problems.value().empty()) {
      std::cout << "ok\n";
      return 0;
    }
    return 1;
  }
  if (args[0] == "init") {
    if (config::config_exists()) {
      std::cerr << "config already exists\n";
      return 1;
    }
    const auto saved = config::save_config(config::Config{});
    if (!saved.ok()) {
      std::cerr << saved.error() << "\n";
      return 1;
    }
    return 0;
  }

  std::cerr << "unknown config command\n";
  return 1;
}

void print_help() {
  std::cout << version_string() << "\n\n";
  std::cout << "usage: toolguard [--config PATH] <command> [options]\n\n";
  std::cout << "classification\n";
  std::cout << "  classify <tool> [args-json] [--json]   Risk classification of a tool call\n";
  std::cout << "  audit <tool> [args-json] [--json]      Network and filesystem-write audit\n";
  std::cout << "  check <tool> [args-json] [--json]      Policy decision (exit 0 approve, 2 deny, 3 prompt)\n";
  std::cout << "  validate-pattern <regex>               Check an allow/deny pattern\n\n";
  std::cout << "settings\n";
  std::cout << "  settings show|reset|validate\n";
  std::cout << "  settings allow <pattern>               Append to the command allowlist\n";
  std::cout << "  settings deny <pattern>                Append to the command denylist\n";
  std::cout << "  settings set <key> <value>             Set one field (camelCase key)\n";
  std::cout << "  override activate <minutes>|clear|status\n\n";
  std::cout << "other\n";
  std::cout << "  config show|path|validate|init\n";
  std::cout << "  version\n";
}

} // namespace

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }

  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "classify") {
    return run_classify(std::move(args));
  }
  if (subcommand == "audit") {
    return run_audit(std::move(args));
  }
  if (subcommand == "check") {
    return run_check(std::move(args));
  }
  if (subcommand == "validate-pattern") {
    return run_validate_pattern(args);
  }
  if (subcommand == "settings") {
    return run_settings(std::move(args));
  }
  if (subcommand == "override") {
    return run_override(std::move(args));
  }
  if (subcommand == "config") {
    return run_config(std::move(args));
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace toolguard::cli
