#include "toolguard/security/sqlite_settings_store.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace toolguard::security {

namespace {

common::Status exec_sql(sqlite3 *db, const std::string &sql) {
  char *err = nullptr;
  const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    const std::string msg = err == nullptr ? "sqlite error" : err;
    if (err != nullptr) {
      sqlite3_free(err);
    }
    return common::Status::error(msg);
  }
  return common::Status::success();
}

std::string now_rfc3339() {
  const auto now = std::chrono::system_clock::now();
  const auto t = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
#ifdef _WIN32
  gmtime_s(&tm, &t);
#else
  gmtime_r(&t, &tm);
#endif

  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return out.str();
}

} // namespace

SqliteSettingsStore::SqliteSettingsStore(std::filesystem::path db_path, SecretKey key)
    : db_path_(std::move(db_path)), key_(key) {
  std::error_code ec;
  if (db_path_.has_parent_path()) {
    std::filesystem::create_directories(db_path_.parent_path(), ec);
  }

  if (sqlite3_open(db_path_.string().c_str(), &db_) != SQLITE_OK) {
    open_error_ = db_ == nullptr ? "sqlite3_open failed" : sqlite3_errmsg(db_);
    if (db_ != nullptr) {
      sqlite3_close(db_);
    }
    db_ = nullptr;
    return;
  }
  sqlite3_busy_timeout(db_, 2000);

  if (const auto status = init_schema(); !status.ok()) {
    open_error_ = status.error();
  }
}

SqliteSettingsStore::~SqliteSettingsStore() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

std::string_view SqliteSettingsStore::name() const { return "sqlite"; }

common::Status SqliteSettingsStore::init_schema() {
  if (db_ == nullptr) {
    return common::Status::error("database is not initialized");
  }
  return exec_sql(db_, R"(
CREATE TABLE IF NOT EXISTS security_settings (
  id INTEGER PRIMARY KEY CHECK (id = 1),
  payload TEXT NOT NULL,
  updated_at TEXT NOT NULL
);
)");
}

common::Result<std::optional<std::string>> SqliteSettingsStore::load() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<std::optional<std::string>>::failure(
        open_error_.empty() ? "database is not initialized" : open_error_);
  }

  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "SELECT payload FROM security_settings WHERE id = 1", -1, &stmt,
                         nullptr) != SQLITE_OK) {
    return common::Result<std::optional<std::string>>::failure(sqlite3_errmsg(db_));
  }

  const int rc = sqlite3_step(stmt);
  if (rc == SQLITE_DONE) {
    sqlite3_finalize(stmt);
    return common::Result<std::optional<std::string>>::success(std::nullopt);
  }
  if (rc != SQLITE_ROW) {
    const std::string error = sqlite3_errmsg(db_);
    sqlite3_finalize(stmt);
    return common::Result<std::optional<std::string>>::failure(error);
  }

  const auto *text = sqlite3_column_text(stmt, 0);
  const std::string payload = text == nullptr ? "" : reinterpret_cast<const char *>(text);
  sqlite3_finalize(stmt);

  const auto decrypted = decrypt_secret(key_, payload);
  if (!decrypted.ok()) {
    return common::Result<std::optional<std::string>>::failure(
        "failed to decrypt stored settings: " + decrypted.error());
  }
  return common::Result<std::optional<std::string>>::success(decrypted.value());
}

common::Status SqliteSettingsStore::save(const std::string &text) {
  const auto encrypted = encrypt_secret(key_, text);
  if (!encrypted.ok()) {
    return common::Status::error("failed to encrypt settings: " + encrypted.error());
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Status::error(open_error_.empty() ? "database is not initialized"
                                                     : open_error_);
  }

  const char *sql = R"(
INSERT INTO security_settings (id, payload, updated_at) VALUES (1, ?1, ?2)
ON CONFLICT(id) DO UPDATE SET payload = excluded.payload, updated_at = excluded.updated_at;
)";
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Status::error(sqlite3_errmsg(db_));
  }

  const std::string updated_at = now_rfc3339();
  sqlite3_bind_text(stmt, 1, encrypted.value().c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 2, updated_at.c_str(), -1, SQLITE_TRANSIENT);

  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Status::error(sqlite3_errmsg(db_));
  }
  return common::Status::success();
}

common::Status SqliteSettingsStore::reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Status::error(open_error_.empty() ? "database is not initialized"
                                                     : open_error_);
  }
  return exec_sql(db_, "DELETE FROM security_settings WHERE id = 1;");
}

} // namespace toolguard::security
