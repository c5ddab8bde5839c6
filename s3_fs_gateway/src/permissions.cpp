#include "permissions.hpp"

namespace auth {

bool glob_match(std::string_view pattern, std::string_view text) {
  size_t p = 0;
  size_t t = 0;
  size_t star = std::string_view::npos;
  size_t star_t = 0;

  while (t < text.size()) {
    if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == text[t])) {
      ++p;
      ++t;
    } else if (p < pattern.size() && pattern[p] == '*') {
      star = p++;
      star_t = t;
    } else if (star != std::string_view::npos) {
      // Backtrack: let the last '*' swallow one more character.
      p = star + 1;
      t = ++star_t;
    } else {
      return false;
    }
  }
  while (p < pattern.size() && pattern[p] == '*') ++p;
  return p == pattern.size();
}

static bool pattern_matches(std::string_view pattern, std::string_view value) {
  if (pattern == "*") return true;
  return glob_match(pattern, value);
}

bool is_allowed(const config::Credential& cred, std::string_view action, std::string_view resource) {
  for (const auto& perm : cred.permissions) {
    if (pattern_matches(perm.action, action) && pattern_matches(perm.resource, resource)) {
      return true;
    }
  }
  return false;
}

} // namespace auth
