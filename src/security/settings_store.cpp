#include "toolguard/security/settings_store.hpp"

#include "toolguard/observability/global.hpp"

#include <exception>

namespace toolguard::security {

namespace {

constexpr const char *COMPONENT = "settings";

} // namespace

std::string_view store_state_to_string(const StoreState state) {
  switch (state) {
  case StoreState::Uninitialized:
    return "uninitialized";
  case StoreState::Initializing:
    return "initializing";
  case StoreState::Ready:
    return "ready";
  }
  return "uninitialized";
}

SettingsStore::SettingsStore(std::shared_ptr<IDurableSettingsStore> durable,
                             std::shared_ptr<ILegacySettingsSource> legacy)
    : durable_(std::move(durable)), legacy_(std::move(legacy)) {
  worker_ = std::thread([this]() { run_worker(); });
}

SettingsStore::~SettingsStore() {
  {
    std::lock_guard<std::mutex> lock(write_mutex_);
    stopping_ = true;
  }
  work_cv_.notify_all();
  if (worker_.joinable()) {
    worker_.join();
  }
}

void SettingsStore::init() {
  StoreState expected = StoreState::Uninitialized;
  if (!state_.compare_exchange_strong(expected, StoreState::Initializing)) {
    return;
  }

  SecuritySettings hydrated;
  try {
    hydrated = hydrate();
  } catch (const std::exception &e) {
    observability::record_warning(COMPONENT,
                                  std::string("init failed, using defaults: ") + e.what());
    hydrated = default_security_settings();
  }

  {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    // A save issued before or during hydration is newer than anything on disk.
    if (!cache_) {
      cache_ = std::make_shared<const SecuritySettings>(std::move(hydrated));
    }
  }
  state_ = StoreState::Ready;
}

void SettingsStore::migrate_legacy() {
  if (!legacy_) {
    return;
  }

  const auto legacy_text = legacy_->read();
  if (!legacy_text.ok()) {
    observability::record_warning(COMPONENT, "legacy settings unreadable: " + legacy_text.error());
  } else if (legacy_text.value().has_value()) {
    const auto existing = durable_ ? durable_->load()
                                   : common::Result<std::optional<std::string>>::failure(
                                         "no durable store configured");
    if (!existing.ok()) {
      observability::record_warning(COMPONENT,
                                    "skipping legacy migration: " + existing.error());
    } else if (!existing.value().has_value()) {
      const auto decoded = settings_from_json(*legacy_text.value());
      if (!decoded.ok()) {
        observability::record_warning(COMPONENT, "legacy settings discarded: " + decoded.error());
      } else if (const auto saved = durable_->save(settings_to_json(decoded.value()));
                 !saved.ok()) {
        observability::record_warning(COMPONENT, "legacy migration failed: " + saved.error());
      } else {
        observability::record_settings("migrate", "legacy settings moved to durable store");
      }
    }
  }

  // The plaintext copy goes whether or not it was migrated.
  if (const auto removed = legacy_->remove(); !removed.ok()) {
    observability::record_warning(COMPONENT, removed.error());
  }
}

SecuritySettings SettingsStore::hydrate() {
  migrate_legacy();

  if (!durable_) {
    return default_security_settings();
  }
  const auto stored = durable_->load();
  if (!stored.ok()) {
    observability::record_warning(COMPONENT, "durable load failed, using defaults: " +
                                                 stored.error());
    return default_security_settings();
  }
  if (!stored.value().has_value()) {
    observability::record_settings("init", "no stored settings, using defaults");
    return default_security_settings();
  }

  auto decoded = settings_from_json(*stored.value());
  if (!decoded.ok()) {
    observability::record_warning(COMPONENT, "stored settings unreadable, using defaults: " +
                                                 decoded.error());
    return default_security_settings();
  }
  observability::record_settings("init", "loaded from " + std::string(durable_->name()));
  return std::move(decoded.value());
}

SecuritySettings SettingsStore::load() const { return *snapshot(); }

std::shared_ptr<const SecuritySettings> SettingsStore::snapshot() const {
  {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    if (cache_) {
      return cache_;
    }
  }
  return std::make_shared<const SecuritySettings>(default_security_settings());
}

void SettingsStore::replace_locked(std::shared_ptr<const SecuritySettings> next,
                                   PendingWrite write) {
  {
    std::lock_guard<std::mutex> cache_lock(cache_mutex_);
    cache_ = std::move(next);
  }
  pending_ = std::move(write);
  observability::record_metric(
      observability::PendingWritesMetric{.depth = 1U + (in_flight_ ? 1U : 0U)});
  work_cv_.notify_one();
}

void SettingsStore::save(const SecuritySettings &settings) {
  auto next = std::make_shared<const SecuritySettings>(settings);
  PendingWrite write{.kind = WriteKind::Save, .payload = settings_to_json(*next)};
  std::lock_guard<std::mutex> lock(write_mutex_);
  replace_locked(std::move(next), std::move(write));
}

void SettingsStore::update(const std::function<void(SecuritySettings &)> &mutate) {
  update_if([&mutate](SecuritySettings &settings) {
    mutate(settings);
    return true;
  });
}

bool SettingsStore::update_if(const std::function<bool(SecuritySettings &)> &mutate) {
  std::lock_guard<std::mutex> lock(write_mutex_);
  SecuritySettings current = load();
  if (!mutate(current)) {
    return false;
  }
  auto next = std::make_shared<const SecuritySettings>(std::move(current));
  PendingWrite write{.kind = WriteKind::Save, .payload = settings_to_json(*next)};
  replace_locked(std::move(next), std::move(write));
  return true;
}

void SettingsStore::reset() {
  auto next = std::make_shared<const SecuritySettings>(default_security_settings());
  std::lock_guard<std::mutex> lock(write_mutex_);
  replace_locked(std::move(next), PendingWrite{.kind = WriteKind::Reset, .payload = {}});
  observability::record_settings("reset", "restored defaults");
}

bool SettingsStore::wait_idle(const std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(write_mutex_);
  return idle_cv_.wait_for(lock, timeout, [this]() { return !pending_ && !in_flight_; });
}

FlushStats SettingsStore::flush_stats() const {
  std::lock_guard<std::mutex> lock(write_mutex_);
  return stats_;
}

void SettingsStore::run_worker() {
  std::unique_lock<std::mutex> lock(write_mutex_);
  while (true) {
    work_cv_.wait(lock, [this]() { return stopping_ || pending_.has_value(); });
    if (!pending_) {
      // Stopping with nothing left to write.
      break;
    }

    PendingWrite write = std::move(*pending_);
    pending_.reset();
    in_flight_ = true;
    lock.unlock();

    flush(write);

    lock.lock();
    in_flight_ = false;
    if (!pending_) {
      idle_cv_.notify_all();
    }
  }
  idle_cv_.notify_all();
}

void SettingsStore::flush(const PendingWrite &write) {
  const auto started = std::chrono::steady_clock::now();
  common::Status status = common::Status::success();
  if (!durable_) {
    status = common::Status::error("no durable store configured");
  } else {
    try {
      status = write.kind == WriteKind::Save ? durable_->save(write.payload) : durable_->reset();
    } catch (const std::exception &e) {
      status = common::Status::error(e.what());
    }
  }
  const auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  observability::record_metric(observability::FlushLatencyMetric{.latency = latency});

  std::lock_guard<std::mutex> lock(write_mutex_);
  ++stats_.attempts;
  if (!status.ok()) {
    ++stats_.failures;
    stats_.last_error = status.error();
    observability::record_warning(COMPONENT,
                                  std::string(write.kind == WriteKind::Save ? "save" : "reset") +
                                      " not persisted: " + status.error());
  }
}

} // namespace toolguard::security
