#pragma once

#include "config.hpp"
#include "credentials.hpp"
#include "sigv4.hpp"

#include <cstdint>
#include <string_view>

namespace auth {

// Authenticate-then-authorize over one credential snapshot. No filesystem access.
class Authorizer {
public:
  explicit Authorizer(const std::vector<config::Credential>& creds);

  Result authorize(const SignedRequest& req,
                   std::string_view action,
                   std::string_view resource,
                   std::int64_t now) const;

  const CredentialStore& credentials() const { return creds_; }

private:
  CredentialStore creds_;
};

} // namespace auth
