#pragma once

#include <functional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace toolguard::tests {

struct TestCase {
  std::string name;
  std::function<void()> fn;
};

/// Throws with `message` when `condition` is false; the runner reports it as [FAIL].
inline void require(const bool condition, const std::string &message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

/// Fails with the full text so a mismatch shows what was actually produced.
inline void require_contains(const std::string &text, const std::string_view needle) {
  if (text.find(needle) == std::string::npos) {
    throw std::runtime_error("expected \"" + std::string(needle) + "\" in: " + text);
  }
}

} // namespace toolguard::tests
