#pragma once

#include "toolguard/common/result.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace toolguard::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] std::string join(const std::vector<std::string> &parts, const std::string &sep);
[[nodiscard]] std::vector<std::string> split_lines(const std::string &text);

[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);

/// Read a whole file. A missing file is reported as success with no value.
[[nodiscard]] Result<std::optional<std::string>> read_file(const std::filesystem::path &path);

/// Write through a sibling temp file and rename over the target.
[[nodiscard]] Status write_file_atomic(const std::filesystem::path &path,
                                       const std::string &content);

} // namespace toolguard::common
