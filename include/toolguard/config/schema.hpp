#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace toolguard::config {

struct StorageConfig {
  std::string database_path = "~/.toolguard/settings.db";
  std::string key_path = "~/.toolguard/settings.key";
  std::string legacy_settings_path = "~/.toolguard/security_settings.json";
};

struct EngineConfig {
  std::vector<std::string> exec_tools = {"exec", "run_command", "shell"};
  std::uint64_t max_search_length = 8192;
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  StorageConfig storage;
  EngineConfig engine;
  ObservabilityConfig observability;
};

} // namespace toolguard::config
