#include "toolguard/security/safe_regex.hpp"

#include <re2/re2.h>

#include <memory>
#include <mutex>
#include <new>
#include <unordered_map>

namespace toolguard::security {

const char *const REDOS_RISK_MESSAGE =
    "Pattern may cause catastrophic backtracking (nested quantifiers or overlapping "
    "alternation)";

namespace {

constexpr std::size_t PATTERN_CACHE_LIMIT = 256;

bool is_repeat(const char ch) { return ch == '+' || ch == '*'; }

RE2::Options operator_pattern_options() {
  RE2::Options options;
  options.set_case_sensitive(false);
  options.set_log_errors(false);
  return options;
}

class PatternCache {
public:
  // Failed compilations are cached too; callers check ok().
  std::shared_ptr<const RE2> get_or_compile(const std::string &pattern) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (const auto it = compiled_.find(pattern); it != compiled_.end()) {
        return it->second;
      }
    }

    auto regex = std::make_shared<const RE2>(pattern, operator_pattern_options());

    std::lock_guard<std::mutex> lock(mutex_);
    if (compiled_.size() >= PATTERN_CACHE_LIMIT) {
      compiled_.clear();
    }
    compiled_.emplace(pattern, regex);
    return regex;
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    compiled_.clear();
  }

private:
  std::mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<const RE2>> compiled_;
};

PatternCache &pattern_cache() {
  static PatternCache cache;
  return cache;
}

} // namespace

bool is_redos_risk(const std::string_view pattern) {
  bool dot_star_seen = false;
  bool alternation_after_dot_star = false;
  char prev = '\0';

  for (std::size_t i = 0; i < pattern.size(); ++i) {
    const char ch = pattern[i];
    if (ch == '\\') {
      ++i;
      prev = '\0';
      continue;
    }

    if (is_repeat(ch) && i + 2 < pattern.size() && pattern[i + 1] == ')' &&
        is_repeat(pattern[i + 2])) {
      return true;
    }

    if (ch == '*' && prev == '.') {
      if (alternation_after_dot_star) {
        return true;
      }
      dot_star_seen = true;
    } else if (ch == '|' && dot_star_seen) {
      alternation_after_dot_star = true;
    }
    prev = ch;
  }
  return false;
}

std::optional<std::string> validate_regex_pattern(const std::string &pattern) {
  if (is_redos_risk(pattern)) {
    return std::string(REDOS_RISK_MESSAGE);
  }
  const RE2 compiled(pattern, operator_pattern_options());
  if (!compiled.ok()) {
    return compiled.error();
  }
  return std::nullopt;
}

bool safe_regex_test(const std::string &pattern, const std::string &input) {
  if (is_redos_risk(pattern) || input.size() > MAX_SAFE_REGEX_INPUT) {
    return false;
  }
  try {
    const auto regex = pattern_cache().get_or_compile(pattern);
    return regex->ok() && RE2::PartialMatch(input, *regex);
  } catch (const std::bad_alloc &) {
    return false;
  }
}

void clear_safe_regex_cache() { pattern_cache().clear(); }

} // namespace toolguard::security
