#pragma once

#include "toolguard/observability/observer.hpp"
#include "toolguard/security/durable_store.hpp"

#include <condition_variable>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace toolguard::testing {

/// In-process durable store with failure injection and an optional gate that holds
/// writes until released.
class MemorySettingsStore final : public security::IDurableSettingsStore {
public:
  [[nodiscard]] common::Result<std::optional<std::string>> load() override;
  [[nodiscard]] common::Status save(const std::string &text) override;
  [[nodiscard]] common::Status reset() override;
  [[nodiscard]] std::string_view name() const override { return "memory"; }

  void set_content(std::optional<std::string> content);
  [[nodiscard]] std::optional<std::string> content() const;

  void fail_loads(std::optional<std::string> error);
  void fail_writes(std::optional<std::string> error);

  /// While held, save() and reset() block until release_writes().
  void hold_writes();
  void release_writes();

  [[nodiscard]] std::size_t save_calls() const;
  [[nodiscard]] std::size_t reset_calls() const;

private:
  mutable std::mutex mutex_;
  std::condition_variable released_;
  std::optional<std::string> content_;
  std::optional<std::string> load_error_;
  std::optional<std::string> write_error_;
  bool held_ = false;
  std::size_t save_calls_ = 0;
  std::size_t reset_calls_ = 0;
};

class MemoryLegacySource final : public security::ILegacySettingsSource {
public:
  explicit MemoryLegacySource(std::optional<std::string> content = std::nullopt);

  [[nodiscard]] common::Result<std::optional<std::string>> read() override;
  [[nodiscard]] common::Status remove() override;

  [[nodiscard]] bool removed() const { return removed_; }
  [[nodiscard]] const std::optional<std::string> &content() const { return content_; }

private:
  std::optional<std::string> content_;
  bool removed_ = false;
};

/// Keeps every event for later inspection.
class RecordingObserver final : public observability::IObserver {
public:
  void record_event(const observability::ObserverEvent &event) override;
  void record_metric(const observability::ObserverMetric &metric) override;
  [[nodiscard]] std::string_view name() const override { return "recording"; }

  [[nodiscard]] std::vector<observability::ObserverEvent> events() const;
  [[nodiscard]] std::size_t metric_count() const;

private:
  mutable std::mutex mutex_;
  std::vector<observability::ObserverEvent> events_;
  std::size_t metrics_ = 0;
};

/// Installs a RecordingObserver as the global observer for its lifetime, then puts a
/// NoopObserver back.
class ObserverScope {
public:
  ObserverScope();
  ~ObserverScope();

  ObserverScope(const ObserverScope &) = delete;
  ObserverScope &operator=(const ObserverScope &) = delete;

  [[nodiscard]] RecordingObserver &observer() { return *observer_; }

private:
  RecordingObserver *observer_ = nullptr;
};

class TempWorkspace {
public:
  TempWorkspace();
  ~TempWorkspace();

  TempWorkspace(const TempWorkspace &) = delete;
  TempWorkspace &operator=(const TempWorkspace &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  void create_file(const std::string &name, const std::string &content) const;

private:
  std::filesystem::path path_;
};

struct EnvGuard {
  std::string key;
  std::optional<std::string> old_value;

  EnvGuard(std::string key_, std::optional<std::string> value);
  ~EnvGuard();
};

} // namespace toolguard::testing
