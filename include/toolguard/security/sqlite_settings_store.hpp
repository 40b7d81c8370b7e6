#pragma once

#include "toolguard/security/durable_store.hpp"
#include "toolguard/security/secrets.hpp"

#include <sqlite3.h>

#include <filesystem>
#include <mutex>

namespace toolguard::security {

/// Single-row SQLite table holding the settings document encrypted with `key`.
class SqliteSettingsStore final : public IDurableSettingsStore {
public:
  SqliteSettingsStore(std::filesystem::path db_path, SecretKey key);
  ~SqliteSettingsStore() override;

  SqliteSettingsStore(const SqliteSettingsStore &) = delete;
  SqliteSettingsStore &operator=(const SqliteSettingsStore &) = delete;

  [[nodiscard]] common::Result<std::optional<std::string>> load() override;
  [[nodiscard]] common::Status save(const std::string &text) override;
  [[nodiscard]] common::Status reset() override;
  [[nodiscard]] std::string_view name() const override;

  /// Error from opening the database, empty when the store is usable.
  [[nodiscard]] const std::string &open_error() const { return open_error_; }

private:
  [[nodiscard]] common::Status init_schema();

  std::filesystem::path db_path_;
  SecretKey key_;
  sqlite3 *db_ = nullptr;
  std::string open_error_;
  std::mutex mutex_;
};

} // namespace toolguard::security
