#pragma once

#include "credentials.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace auth {

enum class AuthError {
  None,
  MissingAuthorization,
  InvalidCredential,   // malformed or incomplete signing input
  InvalidAccessKeyId,
  SignatureDoesNotMatch,
  Expired,
  AccessDenied,
  NotImplemented
};

const char* to_string(AuthError e);

// Header names are lower-case; repeated headers are joined with ','.
using Headers = std::map<std::string, std::string>;

// A request as seen by the verifier: plain strings, no HTTP library types.
struct SignedRequest {
  std::string method;
  std::string target;      // raw request-target, "/path?query"
  Headers headers;
  std::string_view payload;
};

struct Result {
  bool ok = false;
  AuthError error = AuthError::None;
  std::string access_key;
  std::string error_message;
};

inline constexpr std::string_view kAlgorithm = "AWS4-HMAC-SHA256";
inline constexpr std::string_view kUnsignedPayload = "UNSIGNED-PAYLOAD";
inline constexpr std::string_view kStreamingPayload = "STREAMING-AWS4-HMAC-SHA256-PAYLOAD";
inline constexpr std::int64_t kMaxPresignedExpiry = 7 * 24 * 3600;

// Verify AWS Signature Version 4.
// Supports:
//  - Presigned URL query signing (checked first; expiry enforced against `now`)
//  - Authorization header signing
// On success Result::access_key names the resolved credential.
Result verify_sigv4(const SignedRequest& req, const CredentialStore& creds, std::int64_t now);

// Canonical request for `req`. std::nullopt if the path or query carries a
// malformed escape, or a signed header is missing from the request.
std::optional<std::string> canonical_request(const SignedRequest& req,
                                             const std::vector<std::string>& signed_headers_lower,
                                             std::string_view payload_hash,
                                             bool presigned);

// Hex signature of `canonical_req` under the key derived from secret/date/region/service.
std::string compute_signature(std::string_view secret_key,
                              std::string_view yyyymmdd,
                              std::string_view region,
                              std::string_view service,
                              std::string_view amz_date,
                              std::string_view canonical_req);

} // namespace auth
