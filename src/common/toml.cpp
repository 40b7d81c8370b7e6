#include "toolguard/common/toml.hpp"

#include "toolguard/common/fs.hpp"

#include <charconv>
#include <sstream>

namespace toolguard::common {

namespace {

/// Splits `text` on `separator` wherever it falls outside a basic string. With
/// `first_only`, everything after the first separator is dropped.
std::vector<std::string> split_unquoted(const std::string &text, const char separator,
                                        const bool first_only) {
  std::vector<std::string> parts(1);
  bool in_string = false;
  for (std::size_t i = 0; i < text.size(); ++i) {
    const char ch = text[i];
    if (in_string && ch == '\\' && i + 1 < text.size()) {
      parts.back().push_back(ch);
      parts.back().push_back(text[++i]);
      continue;
    }
    if (ch == '"') {
      in_string = !in_string;
    } else if (!in_string && ch == separator) {
      if (first_only) {
        break;
      }
      parts.emplace_back();
      continue;
    }
    parts.back().push_back(ch);
  }
  return parts;
}

std::string unquote(const std::string &raw) {
  const std::string value = trim(raw);
  if (value.size() < 2 || value.front() != '"' || value.back() != '"') {
    return value;
  }
  std::string out;
  out.reserve(value.size() - 2);
  for (std::size_t i = 1; i + 1 < value.size(); ++i) {
    if (value[i] == '\\' && i + 2 < value.size()) {
      ++i;
    }
    out.push_back(value[i]);
  }
  return out;
}

Result<TomlDocument> line_error(const std::string &what, const std::size_t line_number) {
  return Result<TomlDocument>::failure(what + " at line " + std::to_string(line_number));
}

} // namespace

std::string TomlDocument::get_string(const std::string &key, const std::string &fallback) const {
  const auto it = values.find(key);
  return it == values.end() ? fallback : unquote(it->second);
}

std::uint64_t TomlDocument::get_u64(const std::string &key, const std::uint64_t fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  const std::string digits = trim(it->second);
  std::uint64_t parsed = 0;
  const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), parsed);
  if (digits.empty() || ec != std::errc() || ptr != digits.data() + digits.size()) {
    return fallback;
  }
  return parsed;
}

std::vector<std::string>
TomlDocument::get_string_array(const std::string &key,
                               const std::vector<std::string> &fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  const std::string raw = trim(it->second);
  if (raw.size() < 2 || raw.front() != '[' || raw.back() != ']') {
    return fallback;
  }

  std::vector<std::string> out;
  for (const auto &element : split_unquoted(raw.substr(1, raw.size() - 2), ',', false)) {
    if (!trim(element).empty()) {
      out.push_back(unquote(element));
    }
  }
  return out;
}

Result<TomlDocument> parse_toml(const std::string &content) {
  TomlDocument document;
  std::istringstream stream(content);
  std::string line;
  std::string section;
  std::size_t line_number = 0;

  while (std::getline(stream, line)) {
    ++line_number;
    const std::string clean = trim(split_unquoted(line, '#', true).front());
    if (clean.empty()) {
      continue;
    }

    if (clean.front() == '[' && clean.back() == ']') {
      section = trim(clean.substr(1, clean.size() - 2));
      if (section.empty()) {
        return line_error("Invalid empty section", line_number);
      }
      continue;
    }

    const auto equals = clean.find('=');
    if (equals == std::string::npos) {
      return line_error("Invalid key/value", line_number);
    }
    const std::string key = trim(clean.substr(0, equals));
    if (key.empty()) {
      return line_error("Missing key", line_number);
    }
    document.values[section.empty() ? key : section + "." + key] =
        trim(clean.substr(equals + 1));
  }

  return Result<TomlDocument>::success(std::move(document));
}

std::string quote_toml_string(const std::string &value) {
  std::string out = "\"";
  for (const char ch : value) {
    if (ch == '"' || ch == '\\') {
      out.push_back('\\');
    }
    out.push_back(ch);
  }
  return out + "\"";
}

std::string toml_string_array(const std::vector<std::string> &values) {
  std::vector<std::string> quoted;
  quoted.reserve(values.size());
  for (const auto &value : values) {
    quoted.push_back(quote_toml_string(value));
  }
  return "[" + join(quoted, ", ") + "]";
}

} // namespace toolguard::common
