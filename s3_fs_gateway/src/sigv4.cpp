#include "sigv4.hpp"
#include "util.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <functional>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace auth {

const char* to_string(AuthError e) {
  switch (e) {
    case AuthError::None: return "None";
    case AuthError::MissingAuthorization: return "MissingAuthorization";
    case AuthError::InvalidCredential: return "InvalidCredential";
    case AuthError::InvalidAccessKeyId: return "InvalidAccessKeyId";
    case AuthError::SignatureDoesNotMatch: return "SignatureDoesNotMatch";
    case AuthError::Expired: return "Expired";
    case AuthError::AccessDenied: return "AccessDenied";
    case AuthError::NotImplemented: return "NotImplemented";
  }
  return "Unknown";
}

// Empty fields are kept: "a;;b" yields three entries.
static std::vector<std::string> split(std::string_view s, char delim) {
  std::vector<std::string> out(1);
  for (char c : s) {
    if (c == delim) {
      out.emplace_back();
    } else {
      out.back().push_back(c);
    }
  }
  return out;
}

static std::string_view strip(std::string_view s) {
  const auto is_ws = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
  while (!s.empty() && is_ws(s.front())) s.remove_prefix(1);
  while (!s.empty() && is_ws(s.back())) s.remove_suffix(1);
  return s;
}

static std::optional<std::string_view> header_value(const SignedRequest& req, std::string_view name) {
  auto it = req.headers.find(std::string(name));
  if (it == req.headers.end()) return std::nullopt;
  return std::string_view(it->second);
}

// Path segments are re-encoded from their decoded form; '/' is kept.
static std::optional<std::string> canonical_uri(std::string_view path) {
  auto decoded = util::percent_decode(path);
  if (!decoded) return std::nullopt;
  return util::percent_encode(*decoded, false);
}

// Splits a request target into its path ("/" when empty) and raw query.
static std::pair<std::string_view, std::string_view> split_target(std::string_view target) {
  const size_t q = target.find('?');
  std::string_view path = target.substr(0, q);
  std::string_view query = q == std::string_view::npos ? std::string_view{} : target.substr(q + 1);
  if (path.empty()) path = "/";
  return {path, query};
}

// kSigning = HMAC(HMAC(HMAC(HMAC("AWS4" + secret, date), region), service), "aws4_request")
static std::vector<uint8_t> derive_signing_key(std::string_view secret_key,
                                               std::string_view yyyymmdd,
                                               std::string_view region,
                                               std::string_view service) {
  std::vector<uint8_t> key = util::hmac_sha256("AWS4" + std::string(secret_key), yyyymmdd);
  for (std::string_view step : {region, service, std::string_view("aws4_request")}) {
    key = util::hmac_sha256(key, step);
  }
  return key;
}

static Result fail(AuthError code, std::string msg) {
  Result r;
  r.ok = false;
  r.error = code;
  r.error_message = std::move(msg);
  return r;
}

static Result ok(std::string access_key) {
  Result r;
  r.ok = true;
  r.access_key = std::move(access_key);
  return r;
}

// Fields common to both signing forms once parsed.
struct SigningParams {
  std::string access_key;
  std::string date;
  std::string region;
  std::string service;
  std::string amz_date;
  std::string signature;
  std::vector<std::string> signed_headers_list; // lower-case, sorted
};

static bool is_hex_signature(std::string_view s) {
  if (s.size() != 64) return false;
  return std::all_of(s.begin(), s.end(), [](char c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
  });
}

// Credential scope: AKID/YYYYMMDD/REGION/SERVICE/aws4_request
static bool parse_credential_scope(std::string_view cred, SigningParams* out) {
  auto parts = split(cred, '/');
  if (parts.size() != 5) return false;
  for (const auto& p : parts) {
    if (p.empty()) return false;
  }
  if (parts[1].size() != 8 || parts[4] != "aws4_request") return false;
  out->access_key = parts[0];
  out->date = parts[1];
  out->region = parts[2];
  out->service = parts[3];
  return true;
}

static bool parse_signed_headers(std::string_view sh, SigningParams* out) {
  auto parts = split(sh, ';');
  out->signed_headers_list.clear();
  for (const auto& h : parts) {
    if (h.empty()) return false;
    out->signed_headers_list.push_back(util::to_lower(h));
  }
  std::sort(out->signed_headers_list.begin(), out->signed_headers_list.end());
  auto dup = std::adjacent_find(out->signed_headers_list.begin(), out->signed_headers_list.end());
  if (dup != out->signed_headers_list.end()) return false;
  return std::binary_search(out->signed_headers_list.begin(), out->signed_headers_list.end(),
                            std::string("host"));
}

static bool scope_consistent(const SigningParams& sp) {
  return sp.service == "s3" && sp.amz_date.size() == 16 && sp.amz_date.compare(0, 8, sp.date) == 0 &&
         is_hex_signature(sp.signature);
}

// AWS4-HMAC-SHA256 Credential=<scope>, SignedHeaders=<h1;h2>, Signature=<hex>
static std::optional<SigningParams> parse_authorization_sigv4(std::string_view s) {
  if (s.substr(0, kAlgorithm.size()) != kAlgorithm) return std::nullopt;
  s.remove_prefix(kAlgorithm.size());
  if (s.empty() || !std::isspace(static_cast<unsigned char>(s.front()))) return std::nullopt;

  std::map<std::string, std::string, std::less<>> fields;
  for (const std::string& item : split(strip(s), ',')) {
    const std::string_view field = strip(item);
    const size_t eq = field.find('=');
    if (eq == std::string_view::npos) return std::nullopt;
    if (!fields.emplace(field.substr(0, eq), field.substr(eq + 1)).second) return std::nullopt;
  }
  if (fields.size() != 3) return std::nullopt;

  const auto credential = fields.find("Credential");
  const auto signed_headers = fields.find("SignedHeaders");
  const auto signature = fields.find("Signature");
  if (credential == fields.end() || signed_headers == fields.end() || signature == fields.end()) {
    return std::nullopt;
  }

  SigningParams sp;
  if (!parse_credential_scope(credential->second, &sp)) return std::nullopt;
  if (!parse_signed_headers(signed_headers->second, &sp)) return std::nullopt;
  sp.signature = signature->second;
  return sp;
}

static bool has_presigned_params(const util::QueryParams& q) {
  return util::query_has(q, "X-Amz-Signature") || util::query_has(q, "X-Amz-Credential") ||
         util::query_has(q, "X-Amz-Algorithm");
}

static std::string signed_headers_joined(const std::vector<std::string>& names) {
  std::string sh;
  for (size_t i = 0; i < names.size(); ++i) {
    if (i) sh.push_back(';');
    sh += names[i];
  }
  return sh;
}

std::optional<std::string> canonical_request(const SignedRequest& req,
                                             const std::vector<std::string>& signed_headers_lower,
                                             std::string_view payload_hash,
                                             bool presigned) {
  const auto [path, query] = split_target(req.target);
  auto can_uri = canonical_uri(path);
  if (!can_uri) return std::nullopt;

  auto params = util::parse_query(query);
  if (!params) return std::nullopt;
  // Exclude X-Amz-Signature when calculating a presigned canonical query
  const std::string can_query = presigned
      ? util::canonical_query_string(*params, std::optional<std::string_view>("X-Amz-Signature"))
      : util::canonical_query_string(*params);

  std::vector<std::string> names = signed_headers_lower;
  std::sort(names.begin(), names.end());

  std::string can_headers;
  for (const auto& hname : names) {
    auto v = header_value(req, hname);
    if (!v) return std::nullopt;
    can_headers += hname;
    can_headers += ':';
    can_headers += util::trim_and_collapse_ws(*v);
    can_headers += '\n';
  }

  std::ostringstream cr;
  cr << req.method << '\n'
     << *can_uri << '\n'
     << can_query << '\n'
     << can_headers << '\n'
     << signed_headers_joined(names) << '\n'
     << payload_hash;
  return cr.str();
}

std::string compute_signature(std::string_view secret_key,
                              std::string_view yyyymmdd,
                              std::string_view region,
                              std::string_view service,
                              std::string_view amz_date,
                              std::string_view canonical_req) {
  std::ostringstream sts;
  sts << kAlgorithm << '\n'
      << amz_date << '\n'
      << yyyymmdd << '/' << region << '/' << service << "/aws4_request" << '\n'
      << util::sha256_hex(canonical_req);

  auto signing_key = derive_signing_key(secret_key, yyyymmdd, region, service);
  return util::hex_lower(util::hmac_sha256(signing_key, sts.str()));
}

static Result verify_with_params(const SignedRequest& req,
                                 const CredentialStore& creds,
                                 const SigningParams& sp,
                                 std::string_view payload_hash,
                                 bool presigned) {
  if (!scope_consistent(sp)) {
    return fail(AuthError::InvalidCredential, "Malformed credential scope or signature");
  }

  auto creq = canonical_request(req, sp.signed_headers_list, payload_hash, presigned);
  if (!creq) {
    return fail(AuthError::InvalidCredential, "Signed request could not be canonicalized");
  }

  // Unknown keys still pay for the signature computation.
  const config::Credential* cred = creds.find(sp.access_key);
  static const std::string kPlaceholderSecret(40, 'x');
  const std::string_view secret = cred ? std::string_view(cred->secret_key) : std::string_view(kPlaceholderSecret);

  const std::string expected = compute_signature(secret, sp.date, sp.region, sp.service, sp.amz_date, *creq);
  const bool match = util::constant_time_equal(expected, sp.signature);

  if (!cred) {
    return fail(AuthError::InvalidAccessKeyId,
                "The AWS Access Key Id you provided does not exist in our records.");
  }
  if (!match) {
    return fail(AuthError::SignatureDoesNotMatch,
                "The request signature we calculated does not match the signature you provided.");
  }
  return ok(sp.access_key);
}

static Result verify_presigned(const SignedRequest& req,
                               const CredentialStore& creds,
                               const util::QueryParams& q,
                               std::int64_t now) {
  auto alg = util::query_get(q, "X-Amz-Algorithm");
  auto cred = util::query_get(q, "X-Amz-Credential");
  auto date = util::query_get(q, "X-Amz-Date");
  auto exp = util::query_get(q, "X-Amz-Expires");
  auto sh = util::query_get(q, "X-Amz-SignedHeaders");
  auto sig = util::query_get(q, "X-Amz-Signature");

  if (!alg || !cred || !date || !exp || !sh || !sig || *alg != kAlgorithm) {
    return fail(AuthError::InvalidCredential, "Incomplete presigned query parameters");
  }

  auto signed_at = util::parse_amz_date(*date);
  std::int64_t expires = -1;
  auto res = std::from_chars(exp->data(), exp->data() + exp->size(), expires);
  if (!signed_at || res.ec != std::errc{} || res.ptr != exp->data() + exp->size() ||
      expires < 0 || expires > kMaxPresignedExpiry) {
    return fail(AuthError::InvalidCredential, "Invalid X-Amz-Date or X-Amz-Expires");
  }
  if (now > *signed_at + expires) {
    return fail(AuthError::Expired, "Request has expired");
  }

  SigningParams sp;
  // Credential scope in query is URL-encoded already; parse_query decoded it.
  if (!parse_credential_scope(*cred, &sp) || !parse_signed_headers(*sh, &sp)) {
    return fail(AuthError::InvalidCredential, "Malformed presigned credential");
  }
  sp.amz_date = *date;
  sp.signature = *sig;

  // For presigned URLs, SigV4 uses UNSIGNED-PAYLOAD
  return verify_with_params(req, creds, sp, kUnsignedPayload, /*presigned=*/true);
}

static Result verify_header(const SignedRequest& req,
                            const CredentialStore& creds,
                            std::string_view authorization) {
  auto sp = parse_authorization_sigv4(authorization);
  if (!sp) {
    return fail(AuthError::InvalidCredential, "Malformed Authorization header");
  }

  auto amz_date = header_value(req, "x-amz-date");
  if (!amz_date || !util::parse_amz_date(*amz_date)) {
    return fail(AuthError::InvalidCredential, "Missing or invalid x-amz-date");
  }
  sp->amz_date = std::string(*amz_date);

  std::string payload_hash;
  if (auto declared = header_value(req, "x-amz-content-sha256")) {
    if (*declared == kStreamingPayload) {
      return fail(AuthError::NotImplemented, "Streaming SigV4 payload signing is not implemented");
    }
    if (*declared != kUnsignedPayload &&
        !util::constant_time_equal(*declared, util::sha256_hex(req.payload))) {
      return fail(AuthError::SignatureDoesNotMatch, "x-amz-content-sha256 does not match the payload");
    }
    payload_hash = std::string(*declared);
  } else {
    payload_hash = util::sha256_hex(req.payload);
  }

  return verify_with_params(req, creds, *sp, payload_hash, /*presigned=*/false);
}

Result verify_sigv4(const SignedRequest& req, const CredentialStore& creds, std::int64_t now) {
  auto q = util::parse_query(split_target(req.target).second);
  if (!q) {
    return fail(AuthError::InvalidCredential, "Malformed query string");
  }

  if (has_presigned_params(*q)) {
    return verify_presigned(req, creds, *q, now);
  }

  if (auto authz = header_value(req, "authorization")) {
    return verify_header(req, creds, *authz);
  }

  return fail(AuthError::MissingAuthorization, "Missing or invalid authentication");
}

} // namespace auth
