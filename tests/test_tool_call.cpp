#include "test_framework.hpp"

#include "toolguard/security/tool_call.hpp"

void register_tool_call_tests(std::vector<toolguard::tests::TestCase> &tests) {
  using toolguard::tests::require;
  namespace sec = toolguard::security;

  tests.push_back({"parse_tool_args_keeps_order_and_types", [] {
                     const auto parsed = sec::parse_tool_args(
                         R"({"command":"ls -la","timeout":30,"env":{"A":"1"},"flags":["-v",true],"cwd":null})");
                     require(parsed.ok(), parsed.ok() ? "" : parsed.error());
                     const auto &args = parsed.value();
                     require(args.size() == 5, "five arguments");
                     require(args[0].first == "command" && args[0].second.is_string(), "command");
                     require(args[0].second.scalar == "ls -la", "command text");
                     require(args[1].second.kind == sec::ArgValue::Kind::Number, "number");
                     require(args[2].second.kind == sec::ArgValue::Kind::Object, "object");
                     require(args[3].second.kind == sec::ArgValue::Kind::Array, "array");
                     require(args[4].second.kind == sec::ArgValue::Kind::Null, "null");
                   }});

  tests.push_back({"parse_tool_args_decodes_escapes", [] {
                     const auto parsed = sec::parse_tool_args(R"({"text":"a\"b\ncé"})");
                     require(parsed.ok(), "should parse");
                     require(parsed.value()[0].second.scalar == "a\"b\nc\xC3\xA9",
                             "escapes should decode to UTF-8");
                   }});

  tests.push_back({"parse_tool_args_rejects_bad_input", [] {
                     require(sec::parse_tool_args("").ok(), "empty text means no arguments");
                     require(sec::parse_tool_args("").value().empty(), "no arguments");
                     require(!sec::parse_tool_args("[1,2]").ok(), "array is not an object");
                     require(!sec::parse_tool_args("{\"a\":").ok(), "truncated");
                     require(!sec::parse_tool_args("{\"a\":1} trailing").ok(), "trailing text");
                     std::string deep;
                     for (int i = 0; i < 100; ++i) {
                       deep += "{\"a\":";
                     }
                     deep += "1";
                     for (int i = 0; i < 100; ++i) {
                       deep += "}";
                     }
                     require(!sec::parse_tool_args(deep).ok(), "nesting limit");
                   }});

  tests.push_back({"value_text_flattens_values", [] {
                     require(sec::value_text(sec::ArgValue::string("x y")) == "x y", "string");
                     require(sec::value_text(sec::ArgValue::array(
                                 {sec::ArgValue::string("-la"), sec::ArgValue::string("/tmp")})) ==
                                 "-la /tmp",
                             "array is space-joined");
                     require(sec::value_text(sec::ArgValue::object(
                                 {{"k", sec::ArgValue::string("v")}})) == R"({"k":"v"})",
                             "object is JSON");
                   }});

  tests.push_back({"search_string_for_exec_tools_uses_every_argument", [] {
                     const sec::ToolArgs args = {{"command", sec::ArgValue::string("ls")},
                                                 {"argv", sec::ArgValue::array(
                                                              {sec::ArgValue::string("-la")})},
                                                 {"timeout", sec::ArgValue::number("30")},
                                                 {"cwd", sec::ArgValue::null()}};
                     require(sec::build_search_string("exec", args) == "exec ls -la 30",
                             sec::build_search_string("exec", args));
                   }});

  tests.push_back({"search_string_for_other_tools_uses_path_keys_only", [] {
                     const sec::ToolArgs args = {{"url", sec::ArgValue::string("http://a.test")},
                                                 {"body", sec::ArgValue::string("rm -rf /")},
                                                 {"path", sec::ArgValue::string("/tmp/x")}};
                     require(sec::build_search_string("fetch", args) == "fetch http://a.test /tmp/x",
                             sec::build_search_string("fetch", args));
                   }});

  tests.push_back({"search_string_is_truncated", [] {
                     sec::ToolCallOptions options;
                     options.max_search_length = 16;
                     const sec::ToolArgs args = {
                         {"command", sec::ArgValue::string(std::string(100, 'x'))}};
                     require(sec::build_search_string("exec", args, options).size() == 16,
                             "should truncate");
                   }});

  tests.push_back({"exec_tools_are_configurable", [] {
                     sec::ToolCallOptions options;
                     options.exec_tools = {"bash"};
                     require(sec::is_exec_tool("bash", options), "custom exec tool");
                     require(!sec::is_exec_tool("exec", options), "default replaced");
                     require(sec::is_exec_tool("run_command"), "default set");
                   }});
}
