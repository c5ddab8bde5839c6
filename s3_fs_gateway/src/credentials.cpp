#include "credentials.hpp"

namespace auth {

CredentialStore::CredentialStore(const std::vector<config::Credential>& creds) {
  by_key_.reserve(creds.size());
  for (const auto& c : creds) {
    // config::validate() rejects duplicates; first one wins otherwise.
    by_key_.emplace(c.access_key, c);
  }
}

const config::Credential* CredentialStore::find(std::string_view access_key) const {
  auto it = by_key_.find(std::string(access_key));
  if (it == by_key_.end()) return nullptr;
  return &it->second;
}

} // namespace auth
