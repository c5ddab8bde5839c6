#pragma once

#include "authorizer.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "multipart.hpp"
#include "sigv4.hpp"
#include "storage.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <boost/beast/http.hpp>

namespace s3 {

namespace http = boost::beast::http;

using Request = http::request<http::vector_body<char>>;
using Response = http::response<http::vector_body<char>>;

// Configuration plus the authorizer built from its credentials. Replaced as a
// whole on reload; a request uses the snapshot it loaded at its start.
struct Snapshot {
  explicit Snapshot(config::Config cfg);

  config::Config config;
  auth::Authorizer authorizer;
};

// (HTTP status, S3 error Code) for every error kind.
std::pair<http::status, std::string_view> to_http(storage::ErrorCode code);
std::pair<http::status, std::string_view> to_http(auth::AuthError error);

struct ByteRange {
  std::int64_t start = 0;
  std::int64_t end = 0; // inclusive
};

// Single range only: bytes=start-end | bytes=start- | bytes=-suffix.
// std::nullopt when unsatisfiable for an object of `size` bytes.
std::optional<ByteRange> parse_single_range(std::string_view header_value, std::int64_t size);

// Lower-cased header map for signature verification.
auth::Headers collect_headers(const Request& req);

// S3 error response for a request rejected before routing, e.g. a body over
// the server limit.
Response make_error(const Request& req, http::status st, std::string_view code, std::string_view message);

class Api {
public:
  Api(storage::FsObjectStore* store,
      multipart::Coordinator* uploads,
      std::shared_ptr<const Snapshot> snapshot);

  Response handle(const Request& req);

  // Swap in a new snapshot. storage.location changes are ignored.
  void reload(std::shared_ptr<const Snapshot> next);
  std::shared_ptr<const Snapshot> snapshot() const;

private:
  storage::FsObjectStore* store_;
  multipart::Coordinator* uploads_;
  std::shared_ptr<const Snapshot> snapshot_;
};

} // namespace s3
