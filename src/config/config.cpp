#include "toolguard/config/config.hpp"

#include "toolguard/common/fs.hpp"
#include "toolguard/common/toml.hpp"

#include <cstdlib>
#include <sstream>

namespace toolguard::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".toolguard";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("TOOLGUARD_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::optional<std::string> env_value(const char *name) {
  if (const char *value = std::getenv(name); value != nullptr && *value != '\0') {
    return std::string(value);
  }
  return std::nullopt;
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (auto override_path = resolved_config_path_override(); override_path.has_value()) {
    const auto parent = override_path->parent_path();
    return common::Result<std::filesystem::path>::success(parent.empty() ? "." : parent);
  }
  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (auto override_path = resolved_config_path_override(); override_path.has_value()) {
    return common::Result<std::filesystem::path>::success(*override_path);
  }
  const auto dir = config_dir();
  if (!dir.ok()) {
    return common::Result<std::filesystem::path>::failure(dir.error());
  }
  return common::Result<std::filesystem::path>::success(dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  std::error_code ec;
  return path.ok() && std::filesystem::exists(path.value(), ec);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  g_config_path_override = std::move(path);
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

void apply_env_overrides(Config &config) {
  if (auto db = env_value("TOOLGUARD_DB_PATH"); db.has_value()) {
    config.storage.database_path = *db;
  }
  if (auto key = env_value("TOOLGUARD_KEY_PATH"); key.has_value()) {
    config.storage.key_path = *key;
  }
  if (auto backend = env_value("TOOLGUARD_OBSERVABILITY"); backend.has_value()) {
    config.observability.backend = *backend;
  }
}

common::Result<Config> parse_config(const std::string &toml_text) {
  const auto parsed = common::parse_toml(toml_text);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error());
  }
  const auto &doc = parsed.value();

  Config config;
  config.storage.database_path =
      doc.get_string("storage.database_path", config.storage.database_path);
  config.storage.key_path = doc.get_string("storage.key_path", config.storage.key_path);
  config.storage.legacy_settings_path =
      doc.get_string("storage.legacy_settings_path", config.storage.legacy_settings_path);

  config.engine.exec_tools = doc.get_string_array("engine.exec_tools", config.engine.exec_tools);
  config.engine.max_search_length =
      doc.get_u64("engine.max_search_length", config.engine.max_search_length);

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error());
  }

  const auto content = common::read_file(cfg_path_result.value());
  if (!content.ok()) {
    return common::Result<Config>::failure(content.error());
  }

  Config config;
  if (content.value().has_value()) {
    auto parsed = parse_config(*content.value());
    if (!parsed.ok()) {
      return common::Result<Config>::failure(cfg_path_result.value().string() + ": " +
                                             parsed.error());
    }
    config = std::move(parsed.value());
  }

  apply_env_overrides(config);
  return common::Result<Config>::success(std::move(config));
}

std::string render_config(const Config &config) {
  std::ostringstream out;
  out << "[storage]\n";
  out << "database_path = " << common::quote_toml_string(config.storage.database_path) << "\n";
  out << "key_path = " << common::quote_toml_string(config.storage.key_path) << "\n";
  out << "legacy_settings_path = "
      << common::quote_toml_string(config.storage.legacy_settings_path) << "\n";

  out << "\n[engine]\n";
  out << "exec_tools = " << common::toml_string_array(config.engine.exec_tools) << "\n";
  out << "max_search_length = " << config.engine.max_search_length << "\n";

  out << "\n[observability]\n";
  out << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";
  return out.str();
}

common::Status save_config(const Config &config) {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Status::error(cfg_path_result.error());
  }
  return common::write_file_atomic(cfg_path_result.value(), render_config(config));
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  std::vector<std::string> problems;
  if (common::trim(config.storage.database_path).empty()) {
    problems.emplace_back("storage.database_path must not be empty");
  }
  if (common::trim(config.storage.key_path).empty()) {
    problems.emplace_back("storage.key_path must not be empty");
  }
  if (config.engine.exec_tools.empty()) {
    problems.emplace_back("engine.exec_tools must name at least one tool");
  }
  if (config.engine.max_search_length == 0) {
    problems.emplace_back("engine.max_search_length must be greater than zero");
  }
  for (const auto &backend : observability_backends(config)) {
    if (!is_known_backend(backend)) {
      problems.emplace_back("observability.backend is not recognised: " + backend);
    }
  }
  return common::Result<std::vector<std::string>>::success(std::move(problems));
}

std::vector<std::string> observability_backends(const Config &config) {
  std::vector<std::string> names;
  std::stringstream stream(common::to_lower(config.observability.backend));
  std::string part;
  while (std::getline(stream, part, ',')) {
    if (auto name = common::trim(part); !name.empty()) {
      names.push_back(std::move(name));
    }
  }
  return names;
}

bool is_known_backend(const std::string &name) {
  return name == "log" || name == "noop" || name == "none";
}

} // namespace toolguard::config
