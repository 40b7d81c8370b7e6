#include "tests/helpers/test_helpers.hpp"

#include "toolguard/observability/global.hpp"
#include "toolguard/observability/noop_observer.hpp"

#include <cstdlib>
#include <fstream>
#include <memory>
#include <random>

namespace toolguard::testing {

common::Result<std::optional<std::string>> MemorySettingsStore::load() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (load_error_.has_value()) {
    return common::Result<std::optional<std::string>>::failure(*load_error_);
  }
  return common::Result<std::optional<std::string>>::success(content_);
}

common::Status MemorySettingsStore::save(const std::string &text) {
  std::unique_lock<std::mutex> lock(mutex_);
  released_.wait(lock, [this]() { return !held_; });
  ++save_calls_;
  if (write_error_.has_value()) {
    return common::Status::error(*write_error_);
  }
  content_ = text;
  return common::Status::success();
}

common::Status MemorySettingsStore::reset() {
  std::unique_lock<std::mutex> lock(mutex_);
  released_.wait(lock, [this]() { return !held_; });
  ++reset_calls_;
  if (write_error_.has_value()) {
    return common::Status::error(*write_error_);
  }
  content_.reset();
  return common::Status::success();
}

void MemorySettingsStore::set_content(std::optional<std::string> content) {
  std::lock_guard<std::mutex> lock(mutex_);
  content_ = std::move(content);
}

std::optional<std::string> MemorySettingsStore::content() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return content_;
}

void MemorySettingsStore::fail_loads(std::optional<std::string> error) {
  std::lock_guard<std::mutex> lock(mutex_);
  load_error_ = std::move(error);
}

void MemorySettingsStore::fail_writes(std::optional<std::string> error) {
  std::lock_guard<std::mutex> lock(mutex_);
  write_error_ = std::move(error);
}

void MemorySettingsStore::hold_writes() {
  std::lock_guard<std::mutex> lock(mutex_);
  held_ = true;
}

void MemorySettingsStore::release_writes() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    held_ = false;
  }
  released_.notify_all();
}

std::size_t MemorySettingsStore::save_calls() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return save_calls_;
}

std::size_t MemorySettingsStore::reset_calls() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return reset_calls_;
}

MemoryLegacySource::MemoryLegacySource(std::optional<std::string> content)
    : content_(std::move(content)) {}

common::Result<std::optional<std::string>> MemoryLegacySource::read() {
  return common::Result<std::optional<std::string>>::success(content_);
}

common::Status MemoryLegacySource::remove() {
  content_.reset();
  removed_ = true;
  return common::Status::success();
}

void RecordingObserver::record_event(const observability::ObserverEvent &event) {
  std::lock_guard<std::mutex> lock(mutex_);
  events_.push_back(event);
}

void RecordingObserver::record_metric(const observability::ObserverMetric &) {
  std::lock_guard<std::mutex> lock(mutex_);
  ++metrics_;
}

std::vector<observability::ObserverEvent> RecordingObserver::events() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return events_;
}

std::size_t RecordingObserver::metric_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return metrics_;
}

ObserverScope::ObserverScope() {
  auto observer = std::make_unique<RecordingObserver>();
  observer_ = observer.get();
  observability::set_global_observer(std::move(observer));
}

ObserverScope::~ObserverScope() {
  observability::set_global_observer(std::make_unique<observability::NoopObserver>());
}

TempWorkspace::TempWorkspace() {
  static std::mt19937_64 rng{std::random_device{}()};
  path_ = std::filesystem::temp_directory_path() /
          ("toolguard-test-workspace-" + std::to_string(rng()));
  std::filesystem::create_directories(path_);
}

TempWorkspace::~TempWorkspace() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

void TempWorkspace::create_file(const std::string &name, const std::string &content) const {
  const auto file = path_ / name;
  if (file.has_parent_path()) {
    std::filesystem::create_directories(file.parent_path());
  }
  std::ofstream out(file, std::ios::binary | std::ios::trunc);
  out << content;
}

EnvGuard::EnvGuard(std::string key_, std::optional<std::string> value) : key(std::move(key_)) {
  if (const char *existing = std::getenv(key.c_str()); existing != nullptr) {
    old_value = existing;
  }
  if (value.has_value()) {
    setenv(key.c_str(), value->c_str(), 1);
  } else {
    unsetenv(key.c_str());
  }
}

EnvGuard::~EnvGuard() {
  if (old_value.has_value()) {
    setenv(key.c_str(), old_value->c_str(), 1);
  } else {
    unsetenv(key.c_str());
  }
}

} // namespace toolguard::testing
