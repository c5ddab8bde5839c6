#pragma once

#include "config.hpp"

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace auth {

// Read-only index over the credentials of one configuration snapshot.
class CredentialStore {
public:
  CredentialStore() = default;
  explicit CredentialStore(const std::vector<config::Credential>& creds);

  // nullptr if the access key is unknown.
  const config::Credential* find(std::string_view access_key) const;

  std::size_t size() const { return by_key_.size(); }

private:
  std::unordered_map<std::string, config::Credential> by_key_;
};

} // namespace auth
