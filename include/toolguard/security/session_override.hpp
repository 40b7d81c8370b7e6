#pragma once

#include "toolguard/common/result.hpp"
#include "toolguard/security/settings_store.hpp"

#include <cstdint>

namespace toolguard::security {

/// Current wall-clock time in unix milliseconds.
[[nodiscard]] std::int64_t now_unix_ms();

/// Time-boxed "approve everything" window stored in the settings' sessionOverrideUntil.
/// Expiry is lazy: only remaining() notices a lapsed deadline and clears it.
class SessionOverride {
public:
  explicit SessionOverride(SettingsStore &store);

  /// Minutes <= 0 clear the window. Fails, leaving the window untouched, when the
  /// deadline would not fit in unix milliseconds.
  common::Status activate(std::int64_t minutes);
  common::Status activate_at(std::int64_t minutes, std::int64_t now_ms);

  void clear();

  /// Milliseconds left, 0 when inactive. Clears and persists a lapsed deadline.
  [[nodiscard]] std::int64_t remaining();
  [[nodiscard]] std::int64_t remaining_at(std::int64_t now_ms);

  [[nodiscard]] bool active() { return remaining() > 0; }

private:
  SettingsStore &store_;
};

} // namespace toolguard::security
