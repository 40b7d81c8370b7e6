#pragma once

#include "toolguard/security/durable_store.hpp"
#include "toolguard/security/settings.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

namespace toolguard::security {

enum class StoreState { Uninitialized, Initializing, Ready };

[[nodiscard]] std::string_view store_state_to_string(StoreState state);

struct FlushStats {
  std::uint64_t attempts = 0;
  std::uint64_t failures = 0;
  std::string last_error;
};

/// Policy settings cache in front of a durable store.
///
/// Reads are synchronous and never touch disk. Each save swaps the cached value
/// wholesale and queues the durable write in a single pending slot drained by a
/// background worker; a newer save replaces a write that has not started yet.
/// Durable failures are logged and counted in flush_stats(), never rolled back.
class SettingsStore {
public:
  explicit SettingsStore(std::shared_ptr<IDurableSettingsStore> durable,
                         std::shared_ptr<ILegacySettingsSource> legacy = nullptr);
  ~SettingsStore();

  SettingsStore(const SettingsStore &) = delete;
  SettingsStore &operator=(const SettingsStore &) = delete;

  /// One-shot hydration: migrates legacy plaintext, then merges the durable row over
  /// the defaults. Any failure leaves the defaults in place. Later calls do nothing.
  void init();

  /// Deep copy of the current settings (the defaults until something is loaded or saved).
  [[nodiscard]] SecuritySettings load() const;

  /// Shared read-only view of the current settings.
  [[nodiscard]] std::shared_ptr<const SecuritySettings> snapshot() const;

  void save(const SecuritySettings &settings);

  /// Read-modify-write of the cached value, serialized against other writers.
  void update(const std::function<void(SecuritySettings &)> &mutate);

  /// As update, but nothing is swapped or queued when `mutate` returns false.
  bool update_if(const std::function<bool(SecuritySettings &)> &mutate);

  /// Restore defaults and clear the durable row.
  void reset();

  [[nodiscard]] StoreState state() const { return state_.load(); }

  /// Block until no durable write is pending or running. False on timeout.
  bool wait_idle(std::chrono::milliseconds timeout);

  [[nodiscard]] FlushStats flush_stats() const;

private:
  enum class WriteKind { Save, Reset };

  struct PendingWrite {
    WriteKind kind = WriteKind::Save;
    std::string payload;
  };

  [[nodiscard]] SecuritySettings hydrate();
  void migrate_legacy();
  void replace_locked(std::shared_ptr<const SecuritySettings> next, PendingWrite write);
  void run_worker();
  void flush(const PendingWrite &write);

  std::shared_ptr<IDurableSettingsStore> durable_;
  std::shared_ptr<ILegacySettingsSource> legacy_;

  mutable std::mutex cache_mutex_;
  std::shared_ptr<const SecuritySettings> cache_;
  std::atomic<StoreState> state_{StoreState::Uninitialized};

  // Lock order: write_mutex_ before cache_mutex_.
  mutable std::mutex write_mutex_;
  std::condition_variable work_cv_;
  std::condition_variable idle_cv_;
  std::optional<PendingWrite> pending_;
  bool in_flight_ = false;
  bool stopping_ = false;
  FlushStats stats_;
  std::thread worker_;
};

} // namespace toolguard::security
