#pragma once

#include "toolguard/common/result.hpp"
#include "toolguard/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <vector>

namespace toolguard::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] bool config_exists();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();

[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Result<Config> parse_config(const std::string &toml_text);
[[nodiscard]] common::Status save_config(const Config &config);
[[nodiscard]] std::string render_config(const Config &config);

[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

/// Entries of observability.backend, lower-cased and trimmed, blanks dropped.
[[nodiscard]] std::vector<std::string> observability_backends(const Config &config);
[[nodiscard]] bool is_known_backend(const std::string &name);

void apply_env_overrides(Config &config);

} // namespace toolguard::config
