#include "test_framework.hpp"

#include "tests/helpers/test_helpers.hpp"
#include "toolguard/cli/commands.hpp"
#include "toolguard/config/config.hpp"
#include "toolguard/security/secrets.hpp"
#include "toolguard/security/settings.hpp"
#include "toolguard/security/sqlite_settings_store.hpp"

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace {

using toolguard::testing::EnvGuard;
using toolguard::testing::TempWorkspace;

/// Points HOME, the config file and both storage paths into a fresh directory.
struct CliHome {
  TempWorkspace workspace;
  EnvGuard home{"HOME", workspace.path().string()};
  EnvGuard config_path{"TOOLGUARD_CONFIG_PATH", (workspace.path() / "config.toml").string()};
  EnvGuard db_path{"TOOLGUARD_DB_PATH", (workspace.path() / "settings.db").string()};
  EnvGuard key_path{"TOOLGUARD_KEY_PATH", (workspace.path() / "settings.key").string()};
  EnvGuard backend{"TOOLGUARD_OBSERVABILITY", std::string("none")};

  ~CliHome() { toolguard::config::clear_config_path_override(); }
};

struct CliRun {
  int code = 0;
  std::string out;
  std::string err;
};

CliRun run_cli(const std::vector<std::string> &args) {
  std::vector<std::string> owned = {"toolguard"};
  owned.insert(owned.end(), args.begin(), args.end());
  std::vector<char *> argv;
  argv.reserve(owned.size());
  for (auto &arg : owned) {
    argv.push_back(arg.data());
  }

  std::ostringstream out;
  std::ostringstream err;
  auto *old_out = std::cout.rdbuf(out.rdbuf());
  auto *old_err = std::cerr.rdbuf(err.rdbuf());
  const int code = toolguard::cli::run_cli(static_cast<int>(argv.size()), argv.data());
  std::cout.rdbuf(old_out);
  std::cerr.rdbuf(old_err);
  return CliRun{.code = code, .out = out.str(), .err = err.str()};
}

CliRun check(const std::string &command) {
  return run_cli({"check", "exec", "{\"command\":\"" + command + "\"}"});
}

} // namespace

void register_cli_tests(std::vector<toolguard::tests::TestCase> &tests) {
  using toolguard::tests::require;
  using toolguard::tests::require_contains;
  namespace sec = toolguard::security;

  tests.push_back({"cli_check_exit_code_follows_outcome", [] {
                     const CliHome home;
                     const auto approved = check("git status");
                     require(approved.code == 0, approved.out + approved.err);
                     require_contains(approved.out, "auto_approve");

                     const auto denied = check("sudo ls /root");
                     require(denied.code == 2, denied.out + denied.err);
                     require_contains(denied.out, "privilege escalation");

                     const auto prompted = check("terraform plan");
                     require(prompted.code == 3, prompted.out + prompted.err);
                     require_contains(prompted.out, "no policy rule applies");
                   }});

  tests.push_back({"cli_check_json_reports_outcome", [] {
                     const CliHome home;
                     const auto result =
                         run_cli({"check", "exec", "{\"command\":\"rm -rf /\"}", "--json"});
                     require(result.code == 2, result.out + result.err);
                     require_contains(result.out, "\"outcome\":\"auto_deny\"");
                     require_contains(result.out, "\"level\":\"critical\"");
                   }});

  tests.push_back({"cli_settings_allow_persists_across_runs", [] {
                     const CliHome home;
                     const auto added = run_cli({"settings", "allow", "^terraform\\b"});
                     require(added.code == 0, added.err);
                     const auto approved = check("terraform plan");
                     require(approved.code == 0, approved.out + approved.err);

                     require(run_cli({"settings", "deny", "\\bplan\\b"}).code == 0, "deny added");
                     const auto denied = check("terraform plan");
                     require(denied.code == 2, denied.out + denied.err);
                     require_contains(denied.out, "denylist");
                   }});

  tests.push_back({"cli_settings_rejects_invalid_patterns", [] {
                     const CliHome home;
                     for (const char *pattern : {"(a+)+$", "([a-z", "^git(?=\\s)"}) {
                       const auto result = run_cli({"settings", "deny", pattern});
                       require(result.code == 1, std::string("accepted ") + pattern);
                       require_contains(result.err, "invalid pattern");
                     }
                     const auto nested =
                         run_cli({"settings", "set", "commandAllowlist", "^ls\\b\n(x+)+"});
                     require(nested.code == 1, "set with a risky line must fail");

                     const auto shown = run_cli({"settings", "show"});
                     require(shown.code == 0, shown.err);
                     require_contains(shown.out, "\"commandDenylist\":[]");
                     require(shown.out.find("(x+)+") == std::string::npos, shown.out);
                   }});

  tests.push_back({"cli_settings_set_validates_values", [] {
                     const CliHome home;
                     require(run_cli({"settings", "set", "autoDenyCritical", "maybe"}).code == 1,
                             "not a boolean");
                     require(run_cli({"settings", "set", "tokenRotationIntervalDays", "-1"}).code ==
                                 1,
                             "negative days");
                     require(run_cli({"settings", "set", "noSuchKey", "1"}).code == 1,
                             "unknown key");
                     require(run_cli({"settings", "set", "autoDenyCritical", "off"}).code == 0,
                             "boolean accepted");
                     const auto prompted = check("rm -rf /");
                     require(prompted.code == 3, prompted.out + prompted.err);
                     require_contains(prompted.out, "typed confirmation required");
                   }});

  tests.push_back({"cli_override_activate_status_clear", [] {
                     const CliHome home;
                     require(run_cli({"override", "status"}).out == "inactive\n", "inactive");

                     const auto activated = run_cli({"override", "activate", "5"});
                     require(activated.code == 0, activated.err);
                     const auto status = run_cli({"override", "status"});
                     require(status.out == "active, 5 min remaining\n", status.out);
                     require(check("terraform plan").code == 0, "override approves");

                     require(run_cli({"override", "clear"}).code == 0, "clear");
                     require(run_cli({"override", "status"}).out == "inactive\n", "cleared");
                   }});

  tests.push_back({"cli_override_rejects_out_of_range_minutes", [] {
                     const CliHome home;
                     const auto huge = run_cli({"override", "activate", "9223372036854775"});
                     require(huge.code == 1, huge.out);
                     require_contains(huge.err, "out of range");
                     require(huge.out.empty(), huge.out);
                     require(run_cli({"override", "status"}).out == "inactive\n", "untouched");
                     require(run_cli({"override", "activate", "soon"}).code == 1, "not a number");
                   }});

  tests.push_back({"cli_override_status_expires_lapsed_deadline", [] {
                     const CliHome home;
                     {
                       const auto key =
                           sec::load_or_create_key(home.workspace.path() / "settings.key");
                       require(key.ok(), key.error());
                       sec::SqliteSettingsStore store(home.workspace.path() / "settings.db",
                                                      key.value());
                       auto settings = sec::default_security_settings();
                       settings.session_override_until = 1'000;
                       const auto saved = store.save(sec::settings_to_json(settings));
                       require(saved.ok(), saved.error());
                     }
                     const auto status = run_cli({"override", "status"});
                     require(status.out == "inactive\n", status.out);
                     const auto shown = run_cli({"settings", "show"});
                     require_contains(shown.out, "\"sessionOverrideUntil\":null");
                   }});

  tests.push_back({"cli_validate_pattern_and_dispatch", [] {
                     const CliHome home;
                     const auto valid = run_cli({"validate-pattern", "^git\\b"});
                     require(valid.code == 0 && valid.out == "ok\n", valid.out);
                     const auto risky = run_cli({"validate-pattern", "(a+)+"});
                     require(risky.code == 1, "risky pattern");
                     require_contains(risky.out, "catastrophic backtracking");

                     require(run_cli({"version"}).code == 0, "version");
                     const auto unknown = run_cli({"frobnicate"});
                     require(unknown.code == 1, "unknown command");
                     require_contains(unknown.err, "Unknown command: frobnicate");
                   }});

  tests.push_back({"cli_config_flag_selects_file", [] {
                     const CliHome home;
                     const auto path = home.workspace.path() / "custom.toml";
                     home.workspace.create_file("custom.toml",
                                                "[engine]\nexec_tools = [\"bash\"]\n");
                     const auto result = run_cli({"--config", path.string(), "check", "bash",
                                                  "{\"command\":\"sudo id\"}"});
                     require(result.code == 2, result.out + result.err);
                     const auto missing = run_cli({"check", "exec", "{}", "--config"});
                     require(missing.code == 1, "missing --config value");
                   }});
}
