#include "toolguard/common/json_util.hpp"

#include "toolguard/common/fs.hpp"

#include <cctype>
#include <cstdint>
#include <cstdio>

namespace toolguard::common {

namespace {

bool is_scalar_terminator(const char ch) {
  return ch == ',' || ch == '}' || ch == ']' || std::isspace(static_cast<unsigned char>(ch)) != 0;
}

int hex_value(const char ch) {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'a' && ch <= 'f') {
    return ch - 'a' + 10;
  }
  if (ch >= 'A' && ch <= 'F') {
    return ch - 'A' + 10;
  }
  return -1;
}

void append_utf8(std::string &out, const std::uint32_t cp) {
  if (cp < 0x80U) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800U) {
    out.push_back(static_cast<char>(0xC0U | (cp >> 6U)));
    out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
  } else if (cp < 0x10000U) {
    out.push_back(static_cast<char>(0xE0U | (cp >> 12U)));
    out.push_back(static_cast<char>(0x80U | ((cp >> 6U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
  } else {
    out.push_back(static_cast<char>(0xF0U | (cp >> 18U)));
    out.push_back(static_cast<char>(0x80U | ((cp >> 12U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80U | ((cp >> 6U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
  }
}

// Reads four hex digits at raw[pos]; returns -1 when malformed.
long read_hex4(const std::string &raw, const std::size_t pos) {
  if (pos + 4 > raw.size()) {
    return -1;
  }
  long value = 0;
  for (std::size_t i = 0; i < 4; ++i) {
    const int digit = hex_value(raw[pos + i]);
    if (digit < 0) {
      return -1;
    }
    value = (value << 4) | digit;
  }
  return value;
}

} // namespace

std::string json_escape(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 8);
  for (const char ch : value) {
    switch (ch) {
    case '"':
      escaped += "\\\"";
      break;
    case '\\':
      escaped += "\\\\";
      break;
    case '\n':
      escaped += "\\n";
      break;
    case '\r':
      escaped += "\\r";
      break;
    case '\t':
      escaped += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20U) {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(ch));
        escaped += buf;
      } else {
        escaped.push_back(ch);
      }
      break;
    }
  }
  return escaped;
}

std::string json_quote(const std::string &value) { return "\"" + json_escape(value) + "\""; }

std::string json_unescape(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    const char ch = raw[i];
    if (ch != '\\' || i + 1 >= raw.size()) {
      out.push_back(ch);
      continue;
    }
    const char next = raw[++i];
    switch (next) {
    case 'n':
      out.push_back('\n');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'b':
      out.push_back('\b');
      break;
    case 'f':
      out.push_back('\f');
      break;
    case 'u': {
      const long high = read_hex4(raw, i + 1);
      if (high < 0) {
        out.push_back(next);
        break;
      }
      i += 4;
      auto cp = static_cast<std::uint32_t>(high);
      if (cp >= 0xD800U && cp <= 0xDBFFU && i + 2 < raw.size() && raw[i + 1] == '\\' &&
          raw[i + 2] == 'u') {
        const long low = read_hex4(raw, i + 3);
        if (low >= 0xDC00 && low <= 0xDFFF) {
          cp = 0x10000U + ((cp - 0xD800U) << 10U) + (static_cast<std::uint32_t>(low) - 0xDC00U);
          i += 6;
        }
      }
      append_utf8(out, cp);
      break;
    }
    default:
      out.push_back(next);
      break;
    }
  }
  return out;
}

std::size_t json_skip_ws(const std::string &text, std::size_t pos) {
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
    ++pos;
  }
  return pos;
}

std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos) {
  bool escaped = false;
  for (std::size_t i = quote_pos + 1; i < json.size(); ++i) {
    const char ch = json[i];
    if (!escaped && ch == '"') {
      return i;
    }
    if (!escaped && ch == '\\') {
      escaped = true;
      continue;
    }
    escaped = false;
  }
  return std::string::npos;
}

std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                      const char open_ch, const char close_ch) {
  if (open_pos >= json.size() || json[open_pos] != open_ch) {
    return std::string::npos;
  }
  std::size_t depth = 0;
  bool in_string = false;
  bool escaped = false;
  for (std::size_t i = open_pos; i < json.size(); ++i) {
    const char ch = json[i];
    if (in_string) {
      if (!escaped && ch == '"') {
        in_string = false;
      } else if (!escaped && ch == '\\') {
        escaped = true;
        continue;
      }
      escaped = false;
      continue;
    }
    if (ch == '"') {
      in_string = true;
      escaped = false;
      continue;
    }
    if (ch == open_ch) {
      ++depth;
    } else if (ch == close_ch) {
      if (depth == 0) {
        return std::string::npos;
      }
      --depth;
      if (depth == 0) {
        return i;
      }
    }
  }
  return std::string::npos;
}

std::size_t json_find_scalar_end(const std::string &json, std::size_t pos) {
  while (pos < json.size() && !is_scalar_terminator(json[pos])) {
    ++pos;
  }
  return pos;
}

Result<JsonFlatMap> json_parse_flat(const std::string &json) {
  JsonFlatMap result;
  const std::string text = trim(json);
  if (text.size() < 2 || text.front() != '{' || text.back() != '}') {
    return Result<JsonFlatMap>::failure("expected a JSON object");
  }

  std::size_t pos = 1;
  while (pos < text.size()) {
    pos = json_skip_ws(text, pos);
    if (pos >= text.size() || text[pos] == '}') {
      break;
    }
    if (text[pos] == ',') {
      ++pos;
      continue;
    }
    if (text[pos] != '"') {
      return Result<JsonFlatMap>::failure("expected key at offset " + std::to_string(pos));
    }
    const auto key_end = json_find_string_end(text, pos);
    if (key_end == std::string::npos) {
      return Result<JsonFlatMap>::failure("unterminated key");
    }
    const std::string key = json_unescape(text.substr(pos + 1, key_end - pos - 1));
    pos = json_skip_ws(text, key_end + 1);
    if (pos >= text.size() || text[pos] != ':') {
      return Result<JsonFlatMap>::failure("expected ':' after key " + key);
    }
    pos = json_skip_ws(text, pos + 1);
    if (pos >= text.size()) {
      return Result<JsonFlatMap>::failure("missing value for key " + key);
    }

    if (text[pos] == '"') {
      const auto val_end = json_find_string_end(text, pos);
      if (val_end == std::string::npos) {
        return Result<JsonFlatMap>::failure("unterminated string for key " + key);
      }
      // Keep the quotes so callers can tell strings from scalars.
      result[key] = text.substr(pos, val_end - pos + 1);
      pos = val_end + 1;
    } else if (text[pos] == '{' || text[pos] == '[') {
      const char open = text[pos];
      const char close = (open == '{') ? '}' : ']';
      const auto end = json_find_matching_token(text, pos, open, close);
      if (end == std::string::npos) {
        return Result<JsonFlatMap>::failure("unbalanced value for key " + key);
      }
      result[key] = text.substr(pos, end - pos + 1);
      pos = end + 1;
    } else {
      const std::size_t end = json_find_scalar_end(text, pos);
      if (end == pos) {
        return Result<JsonFlatMap>::failure("invalid value for key " + key);
      }
      result[key] = text.substr(pos, end - pos);
      pos = end;
    }
  }

  return Result<JsonFlatMap>::success(std::move(result));
}

Result<std::vector<std::string>> json_parse_string_array(const std::string &array_json) {
  const std::string text = trim(array_json);
  if (text.size() < 2 || text.front() != '[' || text.back() != ']') {
    return Result<std::vector<std::string>>::failure("expected a JSON array");
  }

  std::vector<std::string> out;
  std::size_t pos = 1;
  while (pos + 1 < text.size()) {
    pos = json_skip_ws(text, pos);
    if (pos + 1 >= text.size()) {
      break;
    }
    if (text[pos] == ',') {
      ++pos;
      continue;
    }
    if (text[pos] != '"') {
      return Result<std::vector<std::string>>::failure("array element is not a string");
    }
    const auto end = json_find_string_end(text, pos);
    if (end == std::string::npos) {
      return Result<std::vector<std::string>>::failure("unterminated string in array");
    }
    out.push_back(json_unescape(text.substr(pos + 1, end - pos - 1)));
    pos = end + 1;
  }
  return Result<std::vector<std::string>>::success(std::move(out));
}

std::string json_string_array(const std::vector<std::string> &values) {
  std::string out = "[";
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      out += ",";
    }
    out += json_quote(values[i]);
  }
  out += "]";
  return out;
}

} // namespace toolguard::common
