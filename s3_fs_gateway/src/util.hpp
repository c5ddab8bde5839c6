#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <openssl/evp.h>

namespace util {

using QueryParams = std::vector<std::pair<std::string, std::string>>;

// RFC 1123 date, e.g. "Wed, 21 Oct 2015 07:28:00 GMT"
std::string rfc1123_gmt(std::int64_t epoch_seconds);
// ISO 8601 as used in S3 listings, e.g. "2015-10-21T07:28:00.000Z"
std::string iso8601_gmt(std::int64_t epoch_seconds);
std::int64_t unix_now_seconds();

// Parse an X-Amz-Date timestamp ("YYYYMMDDThhmmssZ") into epoch seconds.
std::optional<std::int64_t> parse_amz_date(std::string_view s);

// Percent-decode (URL decoding). Returns std::nullopt on malformed encoding.
std::optional<std::string> percent_decode(std::string_view in);

// Percent-encode for SigV4 canonicalization.
// If encode_slash is false, '/' is left as-is.
std::string percent_encode(std::string_view in, bool encode_slash);

// Parse query string "a=b&c=d" into vector of (k,v). Decodes percent-encoding.
// Returns std::nullopt if any key or value carries a malformed escape.
std::optional<QueryParams> parse_query(std::string_view query);

std::optional<std::string> query_get(const QueryParams& q, std::string_view key);
bool query_has(const QueryParams& q, std::string_view key);

// Build canonical query string for SigV4: sort by key then value; percent-encode.
std::string canonical_query_string(const QueryParams& params,
                                   std::optional<std::string_view> exclude_key = std::nullopt);

// Trim and normalize spaces per SigV4 canonical header rules.
std::string trim_and_collapse_ws(std::string_view s);

std::string to_lower(std::string_view s);

// Cryptography helpers
std::string sha256_hex(std::string_view data);
std::vector<std::uint8_t> sha256_bin(std::string_view data);

std::vector<std::uint8_t> hmac_sha256(const std::vector<std::uint8_t>& key, std::string_view data);
std::vector<std::uint8_t> hmac_sha256(std::string_view key, std::string_view data);

std::string hex_lower(const std::vector<std::uint8_t>& bytes);
std::optional<std::vector<std::uint8_t>> hex_decode(std::string_view hex);

bool constant_time_equal(std::string_view a, std::string_view b);

// Lowercase hex of `nbytes` bytes from the OpenSSL CSPRNG. Empty on failure.
std::string random_hex(std::size_t nbytes);

// Base64 for continuation tokens
std::string base64_encode(std::string_view in);
std::optional<std::string> base64_decode(std::string_view in);

// Incremental SHA-256 for data that does not fit a single buffer.
class Sha256 {
public:
  Sha256();
  ~Sha256();
  Sha256(const Sha256&) = delete;
  Sha256& operator=(const Sha256&) = delete;

  bool ok() const { return ok_; }
  void update(std::string_view data);
  std::vector<std::uint8_t> final_bin();
  std::string final_hex();

private:
  EVP_MD_CTX* ctx_;
  bool ok_ = false;
};

} // namespace util
