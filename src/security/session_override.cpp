#include "toolguard/security/session_override.hpp"

#include "toolguard/observability/global.hpp"

#include <algorithm>
#include <chrono>
#include <limits>

namespace toolguard::security {

namespace {

constexpr std::int64_t MS_PER_MINUTE = 60'000;

} // namespace

std::int64_t now_unix_ms() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

SessionOverride::SessionOverride(SettingsStore &store) : store_(store) {}

common::Status SessionOverride::activate(const std::int64_t minutes) {
  return activate_at(minutes, now_unix_ms());
}

common::Status SessionOverride::activate_at(const std::int64_t minutes, const std::int64_t now_ms) {
  if (minutes <= 0) {
    clear();
    return common::Status::success();
  }
  const std::int64_t headroom =
      std::numeric_limits<std::int64_t>::max() - std::max<std::int64_t>(now_ms, 0);
  if (minutes > headroom / MS_PER_MINUTE) {
    return common::Status::error("override duration out of range: " + std::to_string(minutes) +
                                 " minutes");
  }
  const std::int64_t until = now_ms + minutes * MS_PER_MINUTE;
  store_.update([until](SecuritySettings &settings) { settings.session_override_until = until; });
  observability::record_settings("override_activate",
                                 std::to_string(minutes) + " minutes, until " +
                                     std::to_string(until));
  return common::Status::success();
}

void SessionOverride::clear() {
  store_.update([](SecuritySettings &settings) { settings.session_override_until.reset(); });
  observability::record_settings("override_clear", "session override cleared");
}

std::int64_t SessionOverride::remaining() { return remaining_at(now_unix_ms()); }

std::int64_t SessionOverride::remaining_at(const std::int64_t now_ms) {
  const auto settings = store_.snapshot();
  if (!settings->session_override_until.has_value()) {
    return 0;
  }

  const std::int64_t until = *settings->session_override_until;
  if (until > now_ms) {
    return until - now_ms;
  }

  const bool expired = store_.update_if([now_ms](SecuritySettings &current) {
    // Another writer may have extended the window since the snapshot.
    if (!current.session_override_until.has_value() ||
        *current.session_override_until > now_ms) {
      return false;
    }
    current.session_override_until.reset();
    return true;
  });
  if (expired) {
    observability::record_settings("override_expired", "session override lapsed");
  }
  return 0;
}

} // namespace toolguard::security
