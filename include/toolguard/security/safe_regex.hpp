#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace toolguard::security {

/// Inputs longer than this never match through safe_regex_test.
inline constexpr std::size_t MAX_SAFE_REGEX_INPUT = 16 * 1024;

/// Message returned by validate_regex_pattern for patterns rejected by is_redos_risk.
extern const char *const REDOS_RISK_MESSAGE;

/// Cheap syntactic pre-filter for patterns prone to catastrophic backtracking.
/// Flags a quantifier closing a group that is itself quantified (`(a+)+`, `(a*)*`,
/// `(a+)*`, `(a*)+`) and two `.*` segments separated by an alternation. Single pass,
/// escape-aware, not a proof: `(a|aa)+` passes and some benign patterns are flagged.
[[nodiscard]] bool is_redos_risk(std::string_view pattern);

/// std::nullopt when the pattern is safe and compiles under RE2 syntax, otherwise the
/// reason it is not. Lookaround and backreferences are rejected.
[[nodiscard]] std::optional<std::string> validate_regex_pattern(const std::string &pattern);

/// Case-insensitive RE2 search of `pattern` in `input`. Linear in the input, never
/// throws. Returns false for risky or malformed patterns and for over-long input.
[[nodiscard]] bool safe_regex_test(const std::string &pattern, const std::string &input);

/// Drop every compiled pattern held by the safe_regex_test cache.
void clear_safe_regex_cache();

} // namespace toolguard::security
