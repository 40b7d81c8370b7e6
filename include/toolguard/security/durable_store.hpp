#pragma once

#include "toolguard/common/result.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace toolguard::security {

/// Encrypted-at-rest home of the serialized settings document.
class IDurableSettingsStore {
public:
  virtual ~IDurableSettingsStore() = default;

  /// No value when nothing has been saved yet.
  [[nodiscard]] virtual common::Result<std::optional<std::string>> load() = 0;
  [[nodiscard]] virtual common::Status save(const std::string &text) = 0;
  [[nodiscard]] virtual common::Status reset() = 0;
  [[nodiscard]] virtual std::string_view name() const = 0;
};

/// Plaintext settings left behind by older installs. Read once, then removed.
class ILegacySettingsSource {
public:
  virtual ~ILegacySettingsSource() = default;

  [[nodiscard]] virtual common::Result<std::optional<std::string>> read() = 0;
  [[nodiscard]] virtual common::Status remove() = 0;
};

class LegacySettingsFile final : public ILegacySettingsSource {
public:
  explicit LegacySettingsFile(std::filesystem::path path);

  [[nodiscard]] common::Result<std::optional<std::string>> read() override;
  [[nodiscard]] common::Status remove() override;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }

private:
  std::filesystem::path path_;
};

} // namespace toolguard::security
