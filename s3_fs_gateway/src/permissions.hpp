#pragma once

#include "config.hpp"

#include <string_view>

namespace auth {

// Glob match over the whole string: '*' matches any run (including '/'),
// '?' matches exactly one character, everything else is literal.
// Case-sensitive.
bool glob_match(std::string_view pattern, std::string_view text);

// Allow if any permission matches both action and resource; default deny.
bool is_allowed(const config::Credential& cred, std::string_view action, std::string_view resource);

} // namespace auth
