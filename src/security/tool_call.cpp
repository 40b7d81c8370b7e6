#include "toolguard/security/tool_call.hpp"

#include "toolguard/common/fs.hpp"
#include "toolguard/common/json_util.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace toolguard::security {

namespace {

constexpr std::size_t MAX_ARG_DEPTH = 64;

class ArgParser {
public:
  explicit ArgParser(const std::string &text) : text_(text) {}

  common::Result<ArgValue> parse_document() {
    auto value = parse_value(0);
    if (!value.ok()) {
      return value;
    }
    pos_ = common::json_skip_ws(text_, pos_);
    if (pos_ != text_.size()) {
      return fail("trailing characters");
    }
    return value;
  }

private:
  common::Result<ArgValue> fail(const std::string &what) const {
    return common::Result<ArgValue>::failure("invalid tool arguments: " + what + " at offset " +
                                             std::to_string(pos_));
  }

  common::Result<ArgValue> parse_value(const std::size_t depth) {
    if (depth > MAX_ARG_DEPTH) {
      return fail("nesting too deep");
    }
    pos_ = common::json_skip_ws(text_, pos_);
    if (pos_ >= text_.size()) {
      return fail("unexpected end of input");
    }

    const char ch = text_[pos_];
    if (ch == '{') {
      return parse_object(depth);
    }
    if (ch == '[') {
      return parse_array(depth);
    }
    if (ch == '"') {
      auto str = parse_string();
      if (!str.ok()) {
        return common::Result<ArgValue>::failure(str.error());
      }
      return common::Result<ArgValue>::success(ArgValue::string(std::move(str.value())));
    }
    return parse_scalar();
  }

  common::Result<std::string> parse_string() {
    const auto end = common::json_find_string_end(text_, pos_);
    if (end == std::string::npos) {
      return common::Result<std::string>::failure("invalid tool arguments: unterminated string");
    }
    std::string value = common::json_unescape(text_.substr(pos_ + 1, end - pos_ - 1));
    pos_ = end + 1;
    return common::Result<std::string>::success(std::move(value));
  }

  common::Result<ArgValue> parse_scalar() {
    const std::size_t end = common::json_find_scalar_end(text_, pos_);
    const std::string token = text_.substr(pos_, end - pos_);
    if (token.empty()) {
      return fail("unexpected character");
    }
    if (token == "true" || token == "false") {
      pos_ = end;
      return common::Result<ArgValue>::success(ArgValue::boolean(token == "true"));
    }
    if (token == "null") {
      pos_ = end;
      return common::Result<ArgValue>::success(ArgValue::null());
    }

    char *parsed_end = nullptr;
    (void)std::strtod(token.c_str(), &parsed_end);
    const bool numeric_start =
        token.front() == '-' || std::isdigit(static_cast<unsigned char>(token.front())) != 0;
    if (!numeric_start || parsed_end != token.c_str() + token.size()) {
      return fail("invalid literal '" + token + "'");
    }
    pos_ = end;
    return common::Result<ArgValue>::success(ArgValue::number(token));
  }

  common::Result<ArgValue> parse_array(const std::size_t depth) {
    ++pos_;
    std::vector<ArgValue> items;
    pos_ = common::json_skip_ws(text_, pos_);
    if (pos_ < text_.size() && text_[pos_] == ']') {
      ++pos_;
      return common::Result<ArgValue>::success(ArgValue::array(std::move(items)));
    }

    while (true) {
      auto item = parse_value(depth + 1);
      if (!item.ok()) {
        return item;
      }
      items.push_back(std::move(item.value()));

      pos_ = common::json_skip_ws(text_, pos_);
      if (pos_ >= text_.size()) {
        return fail("unterminated array");
      }
      if (text_[pos_] == ',') {
        ++pos_;
        continue;
      }
      if (text_[pos_] == ']') {
        ++pos_;
        return common::Result<ArgValue>::success(ArgValue::array(std::move(items)));
      }
      return fail("expected ',' or ']'");
    }
  }

  common::Result<ArgValue> parse_object(const std::size_t depth) {
    ++pos_;
    std::vector<std::pair<std::string, ArgValue>> fields;
    pos_ = common::json_skip_ws(text_, pos_);
    if (pos_ < text_.size() && text_[pos_] == '}') {
      ++pos_;
      return common::Result<ArgValue>::success(ArgValue::object(std::move(fields)));
    }

    while (true) {
      pos_ = common::json_skip_ws(text_, pos_);
      if (pos_ >= text_.size() || text_[pos_] != '"') {
        return fail("expected object key");
      }
      auto key = parse_string();
      if (!key.ok()) {
        return common::Result<ArgValue>::failure(key.error());
      }

      pos_ = common::json_skip_ws(text_, pos_);
      if (pos_ >= text_.size() || text_[pos_] != ':') {
        return fail("expected ':'");
      }
      ++pos_;

      auto value = parse_value(depth + 1);
      if (!value.ok()) {
        return value;
      }
      fields.emplace_back(std::move(key.value()), std::move(value.value()));

      pos_ = common::json_skip_ws(text_, pos_);
      if (pos_ >= text_.size()) {
        return fail("unterminated object");
      }
      if (text_[pos_] == ',') {
        ++pos_;
        continue;
      }
      if (text_[pos_] == '}') {
        ++pos_;
        return common::Result<ArgValue>::success(ArgValue::object(std::move(fields)));
      }
      return fail("expected ',' or '}'");
    }
  }

  const std::string &text_;
  std::size_t pos_ = 0;
};

std::string fields_to_json(const std::vector<std::pair<std::string, ArgValue>> &fields) {
  std::string out = "{";
  for (std::size_t i = 0; i < fields.size(); ++i) {
    if (i > 0) {
      out += ",";
    }
    out += common::json_quote(fields[i].first);
    out += ":";
    out += to_json(fields[i].second);
  }
  out += "}";
  return out;
}

// Array elements: nested containers and null keep their JSON form.
std::string element_text(const ArgValue &item) {
  if (item.kind == ArgValue::Kind::Null || item.kind == ArgValue::Kind::Array ||
      item.kind == ArgValue::Kind::Object) {
    return to_json(item);
  }
  return item.scalar;
}

} // namespace

ArgValue ArgValue::null() { return ArgValue{}; }

ArgValue ArgValue::boolean(const bool value) {
  ArgValue out;
  out.kind = Kind::Boolean;
  out.scalar = value ? "true" : "false";
  return out;
}

ArgValue ArgValue::number(std::string text) {
  ArgValue out;
  out.kind = Kind::Number;
  out.scalar = std::move(text);
  return out;
}

ArgValue ArgValue::string(std::string value) {
  ArgValue out;
  out.kind = Kind::String;
  out.scalar = std::move(value);
  return out;
}

ArgValue ArgValue::array(std::vector<ArgValue> values) {
  ArgValue out;
  out.kind = Kind::Array;
  out.items = std::move(values);
  return out;
}

ArgValue ArgValue::object(std::vector<std::pair<std::string, ArgValue>> values) {
  ArgValue out;
  out.kind = Kind::Object;
  out.fields = std::move(values);
  return out;
}

common::Result<ToolArgs> parse_tool_args(const std::string &json) {
  if (common::trim(json).empty()) {
    return common::Result<ToolArgs>::success({});
  }
  ArgParser parser(json);
  auto parsed = parser.parse_document();
  if (!parsed.ok()) {
    return common::Result<ToolArgs>::failure(parsed.error());
  }
  if (parsed.value().kind != ArgValue::Kind::Object) {
    return common::Result<ToolArgs>::failure("invalid tool arguments: expected a JSON object");
  }
  return common::Result<ToolArgs>::success(std::move(parsed.value().fields));
}

std::string to_json(const ArgValue &value) {
  switch (value.kind) {
  case ArgValue::Kind::Null:
    return "null";
  case ArgValue::Kind::Boolean:
  case ArgValue::Kind::Number:
    return value.scalar;
  case ArgValue::Kind::String:
    return common::json_quote(value.scalar);
  case ArgValue::Kind::Array: {
    std::string out = "[";
    for (std::size_t i = 0; i < value.items.size(); ++i) {
      if (i > 0) {
        out += ",";
      }
      out += to_json(value.items[i]);
    }
    out += "]";
    return out;
  }
  case ArgValue::Kind::Object:
    return fields_to_json(value.fields);
  }
  return "null";
}

std::string to_json(const ToolArgs &args) { return fields_to_json(args); }

std::string value_text(const ArgValue &value) {
  switch (value.kind) {
  case ArgValue::Kind::Null:
    return "";
  case ArgValue::Kind::Boolean:
  case ArgValue::Kind::Number:
  case ArgValue::Kind::String:
    return value.scalar;
  case ArgValue::Kind::Array: {
    std::vector<std::string> parts;
    parts.reserve(value.items.size());
    for (const auto &item : value.items) {
      parts.push_back(element_text(item));
    }
    return common::join(parts, " ");
  }
  case ArgValue::Kind::Object:
    return to_json(value);
  }
  return "";
}

const ArgValue *find_arg(const ToolArgs &args, const std::string_view key) {
  for (const auto &[name, value] : args) {
    if (name == key) {
      return &value;
    }
  }
  return nullptr;
}

bool is_exec_tool(const std::string_view tool_name, const ToolCallOptions &options) {
  return std::find(options.exec_tools.begin(), options.exec_tools.end(), tool_name) !=
         options.exec_tools.end();
}

const std::vector<std::string> &search_arg_keys() {
  static const std::vector<std::string> keys = {"url",         "path",  "file", "filename",
                                                "destination", "target"};
  return keys;
}

std::string build_search_string(const std::string &tool_name, const ToolArgs &args,
                                const ToolCallOptions &options) {
  std::vector<std::string> parts{tool_name};
  const bool exec = is_exec_tool(tool_name, options);
  const auto &keys = search_arg_keys();

  for (const auto &[key, value] : args) {
    if (!exec && std::find(keys.begin(), keys.end(), key) == keys.end()) {
      continue;
    }
    if (value.kind == ArgValue::Kind::Null) {
      continue;
    }
    parts.push_back(value_text(value));
  }

  std::string out = common::join(parts, " ");
  if (out.size() > options.max_search_length) {
    out.resize(options.max_search_length);
  }
  return out;
}

} // namespace toolguard::security
