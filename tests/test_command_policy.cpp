#include "test_framework.hpp"

#include "toolguard/security/command_policy.hpp"
#include "toolguard/security/settings.hpp"

#include <chrono>

void register_command_policy_tests(std::vector<toolguard::tests::TestCase> &tests) {
  using toolguard::tests::require;
  namespace sec = toolguard::security;

  tests.push_back({"allowlist_matches_default_prefixes", [] {
                     const auto defaults = sec::default_security_settings();
                     require(sec::matches_allowlist("git status", defaults.command_allowlist),
                             "git should be allowed");
                     require(sec::matches_allowlist("NPM install", defaults.command_allowlist),
                             "case-insensitive");
                     require(!sec::matches_allowlist("shred secrets.txt", defaults.command_allowlist),
                             "shred is not in the default allowlist");
                   }});

  tests.push_back({"allow_and_deny_lists_match_any_pattern", [] {
                     const std::vector<std::string> patterns = {"^npm publish\\b", "\\bprod\\b"};
                     require(sec::matches_denylist("npm publish --tag next", patterns), "first");
                     require(sec::matches_denylist("kubectl apply -n prod", patterns), "second");
                     require(!sec::matches_denylist("npm test", patterns), "neither");
                     require(!sec::matches_allowlist("anything", {}), "empty list never matches");
                     require(!sec::matches_denylist("anything", {}), "empty list never matches");
                   }});

  tests.push_back({"broken_patterns_fail_closed_without_stopping_the_scan", [] {
                     const std::vector<std::string> patterns = {"([unclosed", "(a+)+$", "^ls\\b"};
                     require(sec::matches_allowlist("ls -la", patterns),
                             "later valid pattern still matches");
                     require(!sec::matches_allowlist("aaaaaaaaaaaa", {"(a+)+$"}),
                             "risky pattern never matches");
                     require(!sec::matches_denylist("([unclosed", {"([unclosed"}),
                             "malformed pattern never matches");
                   }});

  tests.push_back({"redos_pattern_is_bounded_for_any_length", [] {
                     const auto started = std::chrono::steady_clock::now();
                     for (std::size_t length : {12U, 1000U, 20000U}) {
                       require(!sec::matches_allowlist(std::string(length, 'a'), {"(a+)+$"}),
                               "must not match");
                     }
                     require(std::chrono::steady_clock::now() - started < std::chrono::seconds(1),
                             "must not hang");
                   }});

  tests.push_back({"denylist_group_quantifier_survives_long_command", [] {
                     const std::string command = "git " + std::string(16000, 'a');
                     require(!sec::matches_denylist(command, {"(a|b)*c", "(ab|a)*x"}),
                             "neither pattern matches");
                     require(sec::matches_denylist(command, {"(a|b)*c", "^git\\b"}),
                             "later pattern still matches");
                   }});

  tests.push_back({"extract_command_string_for_non_exec_tool_is_tool_name", [] {
                     const sec::ToolArgs args = {{"path", sec::ArgValue::string("/etc/passwd")}};
                     require(sec::extract_command_string("read_file", args) == "read_file",
                             "non-exec tools yield their name");
                   }});

  tests.push_back({"extract_command_string_joins_string_arguments", [] {
                     const sec::ToolArgs args = {{"command", sec::ArgValue::string("ls -la")},
                                                 {"timeout", sec::ArgValue::number("30")},
                                                 {"cwd", sec::ArgValue::string("/tmp")},
                                                 {"argv", sec::ArgValue::array(
                                                              {sec::ArgValue::string("x")})}};
                     require(sec::extract_command_string("exec", args) == "ls -la /tmp",
                             sec::extract_command_string("exec", args));
                     require(sec::extract_command_string("exec", {}).empty(), "no arguments");
                   }});
}
