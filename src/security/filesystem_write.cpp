#include "toolguard/security/filesystem_write.hpp"

#include <regex>

namespace toolguard::security {

namespace {

constexpr auto REGEX_FLAGS = std::regex::ECMAScript | std::regex::icase;

const char *const WRITE_TOOL_PATTERN =
    R"(^(write_file|append_file|delete_file|edit_file|create_file|create_directory|move_file|copy_file|rename_file|file_write|file_edit|rm|mv|cp|tee|touch|mkdir|rmdir|truncate|dd|install|sed\s+-i)\b)";

const char *const WRITE_COMMAND_PATTERNS[] = {
    R"((^|[;&|]\s*|\s)(rm|mv|cp|tee|touch|mkdir|rmdir|truncate|dd|install|ln|chmod|chown)\s)",
    R"(\bsed\s+(-\S+\s+)*-i)",
    R"(>>?\s*(?!/dev/null)(?!&)[^\s|])",
};

std::optional<std::string> extract_path(const ToolArgs &args) {
  for (const auto &key : write_path_keys()) {
    const ArgValue *value = find_arg(args, key);
    if (value != nullptr && value->is_string() && !value->scalar.empty()) {
      return value->scalar;
    }
  }
  return std::nullopt;
}

bool matches_write_command(const std::string &search) {
  static const std::vector<std::regex> patterns = [] {
    std::vector<std::regex> out;
    for (const char *source : WRITE_COMMAND_PATTERNS) {
      out.emplace_back(source, REGEX_FLAGS);
    }
    return out;
  }();

  for (const auto &pattern : patterns) {
    try {
      if (std::regex_search(search, pattern)) {
        return true;
      }
    } catch (const std::regex_error &) {
      continue;
    }
  }
  return false;
}

} // namespace

const std::vector<std::string> &write_path_keys() {
  static const std::vector<std::string> keys = {"path",    "filePath", "file",     "destination",
                                                "dest",    "target",   "directory"};
  return keys;
}

FilesystemWriteResult classify_filesystem_write(const std::string &tool_name,
                                                const ToolArgs &args,
                                                const ToolCallOptions &options) {
  static const std::regex write_tool_regex(WRITE_TOOL_PATTERN, REGEX_FLAGS);

  if (std::regex_search(tool_name, write_tool_regex)) {
    return FilesystemWriteResult{.is_write = true, .target_path = extract_path(args)};
  }
  if (matches_write_command(build_search_string(tool_name, args, options))) {
    return FilesystemWriteResult{.is_write = true, .target_path = std::nullopt};
  }
  return {};
}

} // namespace toolguard::security
