#include "test_framework.hpp"

#include "tests/helpers/test_helpers.hpp"
#include "toolguard/security/session_override.hpp"

#include <chrono>
#include <limits>
#include <memory>
#include <string>

namespace {

constexpr std::int64_t NOW = 1'700'000'000'000;

} // namespace

void register_session_override_tests(std::vector<toolguard::tests::TestCase> &tests) {
  using toolguard::tests::require;
  using toolguard::testing::MemorySettingsStore;
  namespace sec = toolguard::security;

  tests.push_back({"session_override_inactive_by_default", [] {
                     sec::SettingsStore store(std::make_shared<MemorySettingsStore>());
                     sec::SessionOverride override_window(store);
                     require(override_window.remaining_at(NOW) == 0, "nothing active");
                     require(!override_window.active(), "inactive");
                   }});

  tests.push_back({"session_override_activate_sets_deadline", [] {
                     sec::SettingsStore store(std::make_shared<MemorySettingsStore>());
                     sec::SessionOverride override_window(store);
                     require(override_window.activate_at(5, NOW).ok(), "activate");
                     require(store.load().session_override_until == NOW + 300'000,
                             "deadline stored in settings");
                     require(override_window.remaining_at(NOW) == 300'000, "five minutes left");
                     require(override_window.remaining_at(NOW + 299'000) == 1'000, "one second");
                   }});

  tests.push_back({"session_override_expiry_clears_deadline", [] {
                     auto durable = std::make_shared<MemorySettingsStore>();
                     sec::SettingsStore store(durable);
                     sec::SessionOverride override_window(store);
                     require(override_window.activate_at(1, NOW).ok(), "activate");
                     require(override_window.remaining_at(NOW + 60'000) == 0,
                             "deadline reached counts as expired");
                     require(!store.load().session_override_until.has_value(),
                             "lapsed deadline cleared");
                     require(store.wait_idle(std::chrono::seconds(2)), "flush should finish");
                     require(durable->content().value_or("").find(
                                 "\"sessionOverrideUntil\":null") != std::string::npos,
                             "cleared value persisted");
                   }});

  tests.push_back({"session_override_expiry_keeps_extended_window", [] {
                     sec::SettingsStore store(std::make_shared<MemorySettingsStore>());
                     sec::SessionOverride override_window(store);
                     require(override_window.activate_at(1, NOW).ok(), "activate");
                     require(override_window.activate_at(10, NOW + 60'000).ok(), "activate");
                     require(override_window.remaining_at(NOW + 60'000) == 600'000,
                             "re-activation replaces the old deadline");
                   }});

  tests.push_back({"session_override_non_positive_minutes_clear", [] {
                     sec::SettingsStore store(std::make_shared<MemorySettingsStore>());
                     sec::SessionOverride override_window(store);
                     require(override_window.activate_at(5, NOW).ok(), "activate");
                     require(override_window.activate_at(0, NOW).ok(), "activate");
                     require(!store.load().session_override_until.has_value(), "zero clears");
                     require(override_window.activate_at(5, NOW).ok(), "activate");
                     require(override_window.activate_at(-3, NOW).ok(), "activate");
                     require(!store.load().session_override_until.has_value(),
                             "negative clears");
                   }});

  tests.push_back({"session_override_rejects_deadline_past_int64", [] {
                     sec::SettingsStore store(std::make_shared<MemorySettingsStore>());
                     sec::SessionOverride override_window(store);
                     require(override_window.activate_at(5, NOW).ok(), "activate");
                     const auto huge = override_window.activate_at(
                         std::numeric_limits<std::int64_t>::max() / 1000, NOW);
                     require(!huge.ok(), "overflowing duration must be rejected");
                     require(huge.error().find("out of range") != std::string::npos, huge.error());
                     require(store.load().session_override_until == NOW + 300'000,
                             "existing window untouched");

                     const std::int64_t largest =
                         (std::numeric_limits<std::int64_t>::max() - NOW) / 60'000;
                     require(override_window.activate_at(largest, NOW).ok(), "largest fits");
                     require(override_window.remaining_at(NOW) == largest * 60'000,
                             "deadline is exact");
                     require(!override_window.activate_at(largest + 1, NOW).ok(),
                             "one minute more does not fit");
                   }});

  tests.push_back({"session_override_live_window_queues_no_write", [] {
                     auto durable = std::make_shared<MemorySettingsStore>();
                     sec::SettingsStore store(durable);
                     sec::SessionOverride override_window(store);
                     require(override_window.activate_at(5, NOW).ok(), "activate");
                     require(store.wait_idle(std::chrono::seconds(2)), "flush should finish");
                     const auto attempts = store.flush_stats().attempts;
                     require(override_window.remaining_at(NOW + 1'000) == 299'000, "still live");
                     require(override_window.remaining_at(NOW + 400'000) == 0, "lapsed");
                     require(store.wait_idle(std::chrono::seconds(2)), "flush should finish");
                     require(store.flush_stats().attempts == attempts + 1,
                             "only the expiry is written");
                     require(override_window.remaining_at(NOW + 500'000) == 0, "still cleared");
                     require(store.wait_idle(std::chrono::seconds(2)), "flush should finish");
                     require(store.flush_stats().attempts == attempts + 1,
                             "nothing left to expire");
                   }});

  tests.push_back({"session_override_clear", [] {
                     sec::SettingsStore store(std::make_shared<MemorySettingsStore>());
                     sec::SessionOverride override_window(store);
                     require(override_window.activate(15).ok(), "activate");
                     override_window.clear();
                     require(override_window.remaining() == 0, "cleared");
                   }});

  tests.push_back({"session_override_wall_clock", [] {
                     sec::SettingsStore store(std::make_shared<MemorySettingsStore>());
                     sec::SessionOverride override_window(store);
                     require(override_window.activate(5).ok(), "activate");
                     const auto left = override_window.remaining();
                     require(left > 0 && left <= 300'000, "within the window");
                     require(override_window.active(), "active");
                   }});
}
