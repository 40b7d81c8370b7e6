#pragma once

#include "toolguard/common/result.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace toolguard::security {

/// One decoded tool-call argument value.
struct ArgValue {
  enum class Kind { Null, Boolean, Number, String, Array, Object };

  Kind kind = Kind::Null;
  /// String contents, number source text, or "true"/"false".
  std::string scalar;
  std::vector<ArgValue> items;
  std::vector<std::pair<std::string, ArgValue>> fields;

  static ArgValue null();
  static ArgValue boolean(bool value);
  static ArgValue number(std::string text);
  static ArgValue string(std::string value);
  static ArgValue array(std::vector<ArgValue> values);
  static ArgValue object(std::vector<std::pair<std::string, ArgValue>> values);

  [[nodiscard]] bool is_string() const { return kind == Kind::String; }
};

/// Tool-call arguments in the order the caller supplied them.
using ToolArgs = std::vector<std::pair<std::string, ArgValue>>;

/// Decode a JSON object of tool arguments. Nesting deeper than 64 levels is rejected.
[[nodiscard]] common::Result<ToolArgs> parse_tool_args(const std::string &json);

[[nodiscard]] std::string to_json(const ArgValue &value);
[[nodiscard]] std::string to_json(const ToolArgs &args);

/// Text form of a value for matching: strings verbatim, scalars as written, arrays
/// space-joined, objects as JSON.
[[nodiscard]] std::string value_text(const ArgValue &value);

/// First argument named `key`, or nullptr.
[[nodiscard]] const ArgValue *find_arg(const ToolArgs &args, std::string_view key);

/// How tool calls are turned into matchable text.
struct ToolCallOptions {
  std::vector<std::string> exec_tools = {"exec", "run_command", "shell"};
  std::size_t max_search_length = 8192;
};

/// Tool names whose arguments are a command line rather than structured data.
[[nodiscard]] bool is_exec_tool(std::string_view tool_name, const ToolCallOptions &options = {});

/// Argument keys whose values are included in the search string of non-exec tools.
[[nodiscard]] const std::vector<std::string> &search_arg_keys();

/// Tool name plus argument text, truncated to options.max_search_length. Exec tools
/// contribute every argument; other tools only their path/URL-shaped arguments.
[[nodiscard]] std::string build_search_string(const std::string &tool_name, const ToolArgs &args,
                                              const ToolCallOptions &options = {});

} // namespace toolguard::security
