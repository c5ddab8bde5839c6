#include "authorizer.hpp"
#include "logging.hpp"
#include "permissions.hpp"

namespace auth {

Authorizer::Authorizer(const std::vector<config::Credential>& creds) : creds_(creds) {}

Result Authorizer::authorize(const SignedRequest& req,
                             std::string_view action,
                             std::string_view resource,
                             std::int64_t now) const {
  Result r = verify_sigv4(req, creds_, now);
  if (!r.ok) {
    logging::auth()->info("authentication failed: {} ({} {})", to_string(r.error), action, resource);
    return r;
  }

  const config::Credential* cred = creds_.find(r.access_key);
  if (!cred || !is_allowed(*cred, action, resource)) {
    logging::auth()->info("access denied: key={} action={} resource={}", r.access_key, action, resource);
    Result denied;
    denied.error = AuthError::AccessDenied;
    denied.access_key = r.access_key;
    denied.error_message = "Access Denied";
    return denied;
  }

  logging::auth()->debug("authorized key={} action={} resource={}", r.access_key, action, resource);
  return r;
}

} // namespace auth
