#include "s3_api.hpp"
#include "logging.hpp"
#include "util.hpp"

#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/xml_parser.hpp>

#include <algorithm>
#include <atomic>
#include <charconv>
#include <cstdint>
#include <cstdio>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace s3 {
namespace http = boost::beast::http;
namespace bpt = boost::property_tree;

static constexpr const char* kServerName = "s3_fs_gateway";
static constexpr std::string_view kXmlns = "http://s3.amazonaws.com/doc/2006-03-01/";
static constexpr std::int64_t kMaxListKeys = 1000;

static std::atomic<std::uint64_t> g_request_seq{1};

// 16 uppercase hex digits, unique within the process.
static std::string new_request_id() {
  char buf[17];
  std::snprintf(buf, sizeof(buf), "%016llX",
                static_cast<unsigned long long>(g_request_seq.fetch_add(1, std::memory_order_relaxed)));
  return buf;
}

static std::string xml_escape(std::string_view s) {
  std::string out;
  out.reserve(s.size() + s.size() / 8);
  for (char c : s) {
    const char* entity = nullptr;
    if (c == '&') entity = "&amp;";
    else if (c == '<') entity = "&lt;";
    else if (c == '>') entity = "&gt;";
    else if (c == '"') entity = "&quot;";
    else if (c == '\'') entity = "&apos;";
    if (entity) out += entity;
    else out += c;
  }
  return out;
}

struct ParsedTarget {
  std::string bucket;
  std::string key;
  std::string path;
  util::QueryParams query_params;
};

// "<bucket>.<suffix>[:port]" names a bucket when a suffix is configured.
static std::optional<std::string> bucket_from_host(std::string_view host, std::string_view suffix) {
  if (suffix.empty()) return std::nullopt;
  host = host.substr(0, host.find(':'));
  if (host.size() < suffix.size() + 2) return std::nullopt;
  if (host.substr(host.size() - suffix.size()) != suffix) return std::nullopt;
  host.remove_suffix(suffix.size());
  if (host.back() != '.') return std::nullopt;
  host.remove_suffix(1);
  return std::string(host);
}

// Fails on a malformed escape in the path or query.
static std::optional<ParsedTarget> parse_target(const Request& req, std::string_view vhost_suffix) {
  const std::string_view target(req.target().data(), req.target().size());
  const size_t qmark = target.find('?');

  ParsedTarget pt;
  pt.path = std::string(target.substr(0, qmark));
  if (pt.path.empty()) pt.path = "/";
  auto params = util::parse_query(qmark == std::string_view::npos ? std::string_view{} : target.substr(qmark + 1));
  if (!params) return std::nullopt;
  pt.query_params = std::move(*params);

  std::string_view rest(pt.path);
  if (rest.front() == '/') rest.remove_prefix(1);

  const auto host = req.find(http::field::host);
  std::optional<std::string> vhost_bucket;
  if (host != req.end()) {
    vhost_bucket = bucket_from_host(std::string_view(host->value().data(), host->value().size()), vhost_suffix);
  }

  std::optional<std::string> bucket;
  std::optional<std::string> key;
  if (vhost_bucket) {
    // The whole path is the key.
    bucket = std::move(vhost_bucket);
    key = util::percent_decode(rest);
  } else {
    // /bucket or /bucket/key
    const size_t slash = rest.find('/');
    bucket = util::percent_decode(rest.substr(0, slash));
    key = util::percent_decode(slash == std::string_view::npos ? std::string_view{} : rest.substr(slash + 1));
  }
  if (!bucket || !key) return std::nullopt;
  pt.bucket = std::move(*bucket);
  pt.key = std::move(*key);
  return pt;
}

std::pair<http::status, std::string_view> to_http(storage::ErrorCode code) {
  using storage::ErrorCode;
  switch (code) {
    case ErrorCode::NoSuchBucket: return {http::status::not_found, "NoSuchBucket"};
    case ErrorCode::NoSuchKey: return {http::status::not_found, "NoSuchKey"};
    case ErrorCode::BucketAlreadyExists: return {http::status::conflict, "BucketAlreadyExists"};
    case ErrorCode::BucketNotEmpty: return {http::status::conflict, "BucketNotEmpty"};
    case ErrorCode::InvalidBucketName: return {http::status::bad_request, "InvalidBucketName"};
    case ErrorCode::InvalidPath: return {http::status::bad_request, "InvalidArgument"};
    case ErrorCode::PathConflict: return {http::status::conflict, "PathConflict"};
    case ErrorCode::InvalidArgument: return {http::status::bad_request, "InvalidArgument"};
    case ErrorCode::NoSuchUpload: return {http::status::not_found, "NoSuchUpload"};
    case ErrorCode::InvalidPart: return {http::status::bad_request, "InvalidPart"};
    case ErrorCode::InvalidPartOrder: return {http::status::bad_request, "InvalidPartOrder"};
    case ErrorCode::IoFailure:
    case ErrorCode::None:
      break;
  }
  return {http::status::internal_server_error, "InternalError"};
}

std::pair<http::status, std::string_view> to_http(auth::AuthError error) {
  using auth::AuthError;
  switch (error) {
    case AuthError::InvalidAccessKeyId: return {http::status::forbidden, "InvalidAccessKeyId"};
    case AuthError::SignatureDoesNotMatch: return {http::status::forbidden, "SignatureDoesNotMatch"};
    case AuthError::InvalidCredential: return {http::status::forbidden, "AuthorizationHeaderMalformed"};
    case AuthError::NotImplemented: return {http::status::not_implemented, "NotImplemented"};
    case AuthError::MissingAuthorization:
    case AuthError::Expired:
    case AuthError::AccessDenied:
    case AuthError::None:
      break;
  }
  return {http::status::forbidden, "AccessDenied"};
}

static std::string_view auth_message(auth::AuthError error) {
  using auth::AuthError;
  switch (error) {
    case AuthError::MissingAuthorization: return "Request is missing authentication";
    case AuthError::InvalidCredential: return "The authorization information is malformed";
    case AuthError::InvalidAccessKeyId: return "The AWS Access Key Id you provided does not exist in our records.";
    case AuthError::SignatureDoesNotMatch: return "The request signature we calculated does not match the signature you provided.";
    case AuthError::Expired: return "Request has expired";
    case AuthError::NotImplemented: return "A header you provided implies functionality that is not implemented";
    default: return "Access Denied";
  }
}

static std::optional<std::int64_t> parse_offset(std::string_view s) {
  if (s.empty()) return std::nullopt;
  std::int64_t v = 0;
  const auto [end, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc{} || end != s.data() + s.size() || v < 0) return std::nullopt;
  return v;
}

std::optional<ByteRange> parse_single_range(std::string_view header_value, std::int64_t size) {
  if (size <= 0) return std::nullopt;
  const std::string value = util::trim_and_collapse_ws(header_value);
  constexpr std::string_view kUnit = "bytes=";
  if (value.compare(0, kUnit.size(), kUnit) != 0) return std::nullopt;
  const std::string_view set = std::string_view(value).substr(kUnit.size());
  const size_t dash = set.find('-');
  if (dash == std::string_view::npos || set.find(',') != std::string_view::npos) return std::nullopt;

  const std::string_view first = set.substr(0, dash);
  const std::string_view last = set.substr(dash + 1);

  if (first.empty()) {
    const auto suffix = parse_offset(last);
    if (!suffix || *suffix == 0) return std::nullopt;
    return ByteRange{std::max<std::int64_t>(0, size - *suffix), size - 1};
  }

  const auto start = parse_offset(first);
  if (!start || *start >= size) return std::nullopt;
  std::int64_t end = size - 1;
  if (!last.empty()) {
    const auto parsed = parse_offset(last);
    if (!parsed || *parsed < *start) return std::nullopt;
    end = std::min(*parsed, size - 1);
  }
  return ByteRange{*start, end};
}

auth::Headers collect_headers(const Request& req) {
  auth::Headers headers;
  for (const auto& field : req) {
    std::string name = util::to_lower(std::string_view(field.name_string().data(), field.name_string().size()));
    std::string_view value(field.value().data(), field.value().size());
    auto [it, inserted] = headers.emplace(name, std::string(value));
    if (!inserted) {
      it->second.push_back(',');
      it->second.append(value.data(), value.size());
    }
  }
  return headers;
}

Snapshot::Snapshot(config::Config cfg) : config(std::move(cfg)), authorizer(config.credentials) {}

namespace {

enum class Op {
  ListBuckets,
  CreateBucket,
  HeadBucket,
  ListObjects,
  DeleteBucket,
  PutObject,
  GetObject,
  HeadObject,
  DeleteObject,
  InitiateUpload,
  UploadPart,
  CompleteUpload,
  AbortUpload,
  Unsupported,
};

struct Route {
  Op op = Op::Unsupported;
  std::string_view action;
  std::string resource;
};

Route route(http::verb method, const ParsedTarget& pt) {
  const auto& q = pt.query_params;
  Route r;
  if (pt.bucket.empty()) {
    if (method == http::verb::get) r = {Op::ListBuckets, "ListAllMyBuckets", "*"};
    return r;
  }
  if (pt.key.empty()) {
    switch (method) {
      case http::verb::put: r = {Op::CreateBucket, "CreateBucket", pt.bucket}; break;
      case http::verb::head: r = {Op::HeadBucket, "ListBucket", pt.bucket}; break;
      case http::verb::get: r = {Op::ListObjects, "ListBucket", pt.bucket}; break;
      case http::verb::delete_: r = {Op::DeleteBucket, "DeleteBucket", pt.bucket}; break;
      default: break;
    }
    return r;
  }

  std::string resource = pt.bucket + "/" + pt.key;
  const bool has_upload_id = util::query_has(q, "uploadId");
  switch (method) {
    case http::verb::put:
      if (has_upload_id && util::query_has(q, "partNumber")) {
        r = {Op::UploadPart, "PutObject", std::move(resource)};
      } else if (!has_upload_id) {
        r = {Op::PutObject, "PutObject", std::move(resource)};
      }
      break;
    case http::verb::post:
      if (util::query_has(q, "uploads")) {
        r = {Op::InitiateUpload, "PutObject", std::move(resource)};
      } else if (has_upload_id) {
        r = {Op::CompleteUpload, "PutObject", std::move(resource)};
      }
      break;
    case http::verb::get: r = {Op::GetObject, "GetObject", std::move(resource)}; break;
    case http::verb::head: r = {Op::HeadObject, "GetObject", std::move(resource)}; break;
    case http::verb::delete_:
      if (has_upload_id) {
        r = {Op::AbortUpload, "AbortMultipartUpload", std::move(resource)};
      } else {
        r = {Op::DeleteObject, "DeleteObject", std::move(resource)};
      }
      break;
    default: break;
  }
  return r;
}

// Per-request state shared by the operation handlers.
class Exchange {
public:
  Exchange(const Request& req, const Snapshot& snap, storage::FsObjectStore* store,
           multipart::Coordinator* uploads)
      : req_(req), snap_(snap), store_(store), uploads_(uploads),
        request_id_(new_request_id()), keep_alive_(req.keep_alive()), version_(req.version()) {}

  Response run();

  Response reject(http::status st, std::string_view code, std::string_view message) {
    std::string_view target(req_.target().data(), req_.target().size());
    pt_.path = std::string(target.substr(0, target.find('?')));
    return error(st, code, message);
  }

private:
  Response xml(http::status st, const std::string& body) const;
  Response empty(http::status st) const;
  Response error(http::status st, std::string_view code, std::string_view message) const;
  Response storage_error(const storage::Error& err) const;
  Response finish(Response res) const;

  std::string_view body() const { return std::string_view(req_.body().data(), req_.body().size()); }
  std::string header(http::field f) const {
    auto it = req_.find(f);
    return it == req_.end() ? std::string() : std::string(it->value().data(), it->value().size());
  }

  Response list_buckets();
  Response create_bucket();
  Response head_bucket();
  Response list_objects();
  Response delete_bucket();
  Response put_object();
  Response get_object(bool head_only);
  Response delete_object();
  Response initiate_upload();
  Response upload_part();
  Response complete_upload();
  Response abort_upload();

  const Request& req_;
  const Snapshot& snap_;
  storage::FsObjectStore* store_;
  multipart::Coordinator* uploads_;
  std::string request_id_;
  bool keep_alive_;
  unsigned version_;
  ParsedTarget pt_;
};

Response Exchange::finish(Response res) const {
  res.set(http::field::server, kServerName);
  res.set("x-amz-request-id", request_id_);
  res.keep_alive(keep_alive_);
  if (req_.method() == http::verb::head) {
    // HEAD responses advertise the length but carry no body.
    auto len = res.body().size();
    res.body().clear();
    res.content_length(len);
  } else {
    res.content_length(res.body().size());
  }
  return res;
}

Response Exchange::xml(http::status st, const std::string& body) const {
  Response res{st, version_};
  res.set(http::field::content_type, "application/xml");
  res.body().assign(body.begin(), body.end());
  return finish(std::move(res));
}

Response Exchange::empty(http::status st) const {
  Response res{st, version_};
  return finish(std::move(res));
}

Response Exchange::error(http::status st, std::string_view code, std::string_view message) const {
  std::ostringstream oss;
  oss << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>"
      << "<Error>"
      << "<Code>" << xml_escape(code) << "</Code>"
      << "<Message>" << xml_escape(message) << "</Message>"
      << "<Resource>" << xml_escape(pt_.path) << "</Resource>"
      << "<RequestId>" << xml_escape(request_id_) << "</RequestId>"
      << "</Error>";
  return xml(st, oss.str());
}

Response Exchange::storage_error(const storage::Error& err) const {
  auto [st, code] = to_http(err.code);
  if (st == http::status::internal_server_error) {
    logging::server()->error("request {} failed: {}", request_id_, err.message);
    return error(st, code, "We encountered an internal error. Please try again.");
  }
  return error(st, code, err.message);
}

Response Exchange::run() {
  auto parsed = parse_target(req_, snap_.config.server.virtual_host_suffix);
  if (!parsed) {
    return reject(http::status::bad_request, "InvalidURI", "Couldn't parse the specified URI.");
  }
  pt_ = std::move(*parsed);

  Route r = route(req_.method(), pt_);
  if (r.op == Op::Unsupported) {
    return error(http::status::method_not_allowed, "MethodNotAllowed",
                 "The specified method is not allowed against this resource.");
  }

  auth::SignedRequest sreq;
  sreq.method = std::string(req_.method_string().data(), req_.method_string().size());
  sreq.target = std::string(req_.target().data(), req_.target().size());
  sreq.headers = collect_headers(req_);
  sreq.payload = body();
  auto ar = snap_.authorizer.authorize(sreq, r.action, r.resource, util::unix_now_seconds());
  if (!ar.ok) {
    auto [st, code] = to_http(ar.error);
    return error(st, code, auth_message(ar.error));
  }

  switch (r.op) {
    case Op::ListBuckets: return list_buckets();
    case Op::CreateBucket: return create_bucket();
    case Op::HeadBucket: return head_bucket();
    case Op::ListObjects: return list_objects();
    case Op::DeleteBucket: return delete_bucket();
    case Op::PutObject: return put_object();
    case Op::GetObject: return get_object(false);
    case Op::HeadObject: return get_object(true);
    case Op::DeleteObject: return delete_object();
    case Op::InitiateUpload: return initiate_upload();
    case Op::UploadPart: return upload_part();
    case Op::CompleteUpload: return complete_upload();
    case Op::AbortUpload: return abort_upload();
    case Op::Unsupported: break;
  }
  return error(http::status::method_not_allowed, "MethodNotAllowed",
               "The specified method is not allowed against this resource.");
}

Response Exchange::list_buckets() {
  storage::Error err;
  auto buckets = store_->list_buckets(&err);
  if (err.code != storage::ErrorCode::None) return storage_error(err);

  std::ostringstream oss;
  oss << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>"
      << "<ListAllMyBucketsResult xmlns=\"" << kXmlns << "\">"
      << "<Owner><ID></ID><DisplayName></DisplayName></Owner>"
      << "<Buckets>";
  for (const auto& b : buckets) {
    oss << "<Bucket><Name>" << xml_escape(b.name) << "</Name>"
        << "<CreationDate>" << util::iso8601_gmt(b.creation_time) << "</CreationDate></Bucket>";
  }
  oss << "</Buckets></ListAllMyBucketsResult>";
  return xml(http::status::ok, oss.str());
}

Response Exchange::create_bucket() {
  storage::Error err;
  if (!store_->create_bucket(pt_.bucket, &err)) return storage_error(err);
  Response res{http::status::ok, version_};
  res.set(http::field::location, "/" + pt_.bucket);
  return finish(std::move(res));
}

Response Exchange::head_bucket() {
  storage::Error err;
  if (!store_->bucket_exists(pt_.bucket, &err)) return storage_error(err);
  return empty(http::status::ok);
}

Response Exchange::delete_bucket() {
  storage::Error err;
  if (!store_->delete_bucket(pt_.bucket, &err)) return storage_error(err);
  return empty(http::status::no_content);
}

Response Exchange::list_objects() {
  const auto& q = pt_.query_params;
  const bool v2 = util::query_get(q, "list-type").value_or("") == "2";
  const std::string prefix = util::query_get(q, "prefix").value_or("");
  const std::string delimiter = util::query_get(q, "delimiter").value_or("");

  std::int64_t max_keys = kMaxListKeys;
  if (auto mk = util::query_get(q, "max-keys")) {
    std::int64_t val = 0;
    auto res = std::from_chars(mk->data(), mk->data() + mk->size(), val);
    if (res.ec != std::errc{} || res.ptr != mk->data() + mk->size()) {
      return error(http::status::bad_request, "InvalidArgument", "max-keys must be an integer");
    }
    max_keys = (val <= 0 || val > kMaxListKeys) ? kMaxListKeys : val;
  }

  std::string marker;
  std::string continuation;
  std::string start_after;
  if (v2) {
    start_after = util::query_get(q, "start-after").value_or("");
    continuation = util::query_get(q, "continuation-token").value_or("");
    if (!continuation.empty()) {
      auto decoded = util::base64_decode(continuation);
      if (!decoded) {
        return error(http::status::bad_request, "InvalidArgument", "The continuation token provided is incorrect");
      }
      marker = std::move(*decoded);
    } else {
      marker = start_after;
    }
  } else {
    marker = util::query_get(q, "marker").value_or("");
  }

  storage::Error err;
  auto lr = store_->list_objects(pt_.bucket, prefix, delimiter, marker, max_keys, &err);
  if (err.code != storage::ErrorCode::None) return storage_error(err);

  std::ostringstream oss;
  oss << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>"
      << "<ListBucketResult xmlns=\"" << kXmlns << "\">"
      << "<Name>" << xml_escape(pt_.bucket) << "</Name>"
      << "<Prefix>" << xml_escape(prefix) << "</Prefix>";
  if (v2) {
    if (!start_after.empty()) oss << "<StartAfter>" << xml_escape(start_after) << "</StartAfter>";
    if (!continuation.empty()) {
      oss << "<ContinuationToken>" << xml_escape(continuation) << "</ContinuationToken>";
    }
    oss << "<KeyCount>" << (lr.objects.size() + lr.common_prefixes.size()) << "</KeyCount>";
  } else {
    oss << "<Marker>" << xml_escape(marker) << "</Marker>";
  }
  oss << "<MaxKeys>" << max_keys << "</MaxKeys>";
  if (!delimiter.empty()) oss << "<Delimiter>" << xml_escape(delimiter) << "</Delimiter>";
  oss << "<IsTruncated>" << (lr.is_truncated ? "true" : "false") << "</IsTruncated>";
  if (lr.is_truncated) {
    if (v2) {
      oss << "<NextContinuationToken>" << xml_escape(util::base64_encode(lr.next_marker))
          << "</NextContinuationToken>";
    } else {
      oss << "<NextMarker>" << xml_escape(lr.next_marker) << "</NextMarker>";
    }
  }

  for (const auto& obj : lr.objects) {
    oss << "<Contents>"
        << "<Key>" << xml_escape(obj.key) << "</Key>"
        << "<LastModified>" << util::iso8601_gmt(obj.meta.mtime) << "</LastModified>"
        << "<ETag>" << xml_escape(obj.meta.etag) << "</ETag>"
        << "<Size>" << obj.meta.size << "</Size>"
        << "<StorageClass>STANDARD</StorageClass>"
        << "</Contents>";
  }
  for (const auto& cp : lr.common_prefixes) {
    oss << "<CommonPrefixes><Prefix>" << xml_escape(cp) << "</Prefix></CommonPrefixes>";
  }

  oss << "</ListBucketResult>";
  return xml(http::status::ok, oss.str());
}

Response Exchange::put_object() {
  if (req_.find("x-amz-copy-source") != req_.end()) {
    return error(http::status::not_implemented, "NotImplemented", "CopyObject is not implemented");
  }
  if (req_.body().size() > snap_.config.server.max_object_bytes) {
    return error(http::status::payload_too_large, "EntityTooLarge",
                 "Your proposed upload exceeds the maximum allowed object size.");
  }

  storage::ObjectMeta meta;
  storage::Error err;
  if (!store_->put_object(pt_.bucket, pt_.key, body(), header(http::field::content_type), &meta, &err)) {
    return storage_error(err);
  }

  Response res{http::status::ok, version_};
  res.set(http::field::etag, meta.etag);
  return finish(std::move(res));
}

Response Exchange::get_object(bool head_only) {
  storage::ObjectMeta meta;
  storage::Error err;
  std::vector<char> data;
  auto sink = [&data](std::string_view chunk) {
    data.insert(data.end(), chunk.begin(), chunk.end());
    return true;
  };

  const std::string range_header = header(http::field::range);
  std::optional<ByteRange> range;
  if (head_only || !range_header.empty()) {
    if (!store_->head_object(pt_.bucket, pt_.key, &meta, &err)) return storage_error(err);
  }
  if (!head_only && !range_header.empty()) {
    range = parse_single_range(range_header, meta.size);
    if (!range) {
      Response res = error(http::status::range_not_satisfiable, "InvalidRange",
                           "The requested range is not satisfiable");
      res.set(http::field::content_range, "bytes */" + std::to_string(meta.size));
      return res;
    }
  }

  if (!head_only) {
    std::uint64_t offset = range ? static_cast<std::uint64_t>(range->start) : 0;
    std::uint64_t length = range ? static_cast<std::uint64_t>(range->end - range->start + 1) : UINT64_MAX;
    if (!store_->read_object(pt_.bucket, pt_.key, offset, length, sink, &meta, &err)) {
      return storage_error(err);
    }
    if (range) {
      // The object may have been replaced between head and read.
      if (data.empty()) {
        Response res = error(http::status::range_not_satisfiable, "InvalidRange",
                             "The requested range is not satisfiable");
        res.set(http::field::content_range, "bytes */" + std::to_string(meta.size));
        return res;
      }
      range->end = range->start + static_cast<std::int64_t>(data.size()) - 1;
    }
  }

  Response res{range ? http::status::partial_content : http::status::ok, version_};
  res.set(http::field::content_type, meta.content_type);
  res.set(http::field::etag, meta.etag);
  res.set(http::field::last_modified, util::rfc1123_gmt(meta.mtime));
  res.set(http::field::accept_ranges, "bytes");
  if (range) {
    res.set(http::field::content_range,
            "bytes " + std::to_string(range->start) + "-" + std::to_string(range->end) + "/" +
                std::to_string(meta.size));
  }
  if (head_only) {
    res = finish(std::move(res));
    res.content_length(static_cast<std::uint64_t>(meta.size));
    return res;
  }
  res.body() = std::move(data);
  return finish(std::move(res));
}

Response Exchange::delete_object() {
  storage::Error err;
  if (!store_->delete_object(pt_.bucket, pt_.key, &err)) {
    // S3 reports success for a key that is already gone.
    if (err.code != storage::ErrorCode::NoSuchKey) return storage_error(err);
  }
  return empty(http::status::no_content);
}

Response Exchange::initiate_upload() {
  std::string upload_id;
  storage::Error err;
  if (!uploads_->initiate(pt_.bucket, pt_.key, header(http::field::content_type), &upload_id, &err)) {
    return storage_error(err);
  }
  std::ostringstream oss;
  oss << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>"
      << "<InitiateMultipartUploadResult xmlns=\"" << kXmlns << "\">"
      << "<Bucket>" << xml_escape(pt_.bucket) << "</Bucket>"
      << "<Key>" << xml_escape(pt_.key) << "</Key>"
      << "<UploadId>" << xml_escape(upload_id) << "</UploadId>"
      << "</InitiateMultipartUploadResult>";
  return xml(http::status::ok, oss.str());
}

Response Exchange::upload_part() {
  const std::string upload_id = util::query_get(pt_.query_params, "uploadId").value_or("");
  const std::string pn = util::query_get(pt_.query_params, "partNumber").value_or("");
  std::uint32_t part_number = 0;
  auto res_pn = std::from_chars(pn.data(), pn.data() + pn.size(), part_number);
  if (pn.empty() || res_pn.ec != std::errc{} || res_pn.ptr != pn.data() + pn.size()) {
    return error(http::status::bad_request, "InvalidArgument",
                 "Part number must be an integer between 1 and 10000");
  }
  if (req_.body().size() > snap_.config.server.max_object_bytes) {
    return error(http::status::payload_too_large, "EntityTooLarge",
                 "Your proposed upload exceeds the maximum allowed object size.");
  }

  std::string etag;
  storage::Error err;
  if (!uploads_->upload_part(pt_.bucket, pt_.key, upload_id, part_number, body(), &etag, &err)) {
    return storage_error(err);
  }
  Response res{http::status::ok, version_};
  res.set(http::field::etag, etag);
  return finish(std::move(res));
}

Response Exchange::complete_upload() {
  const std::string upload_id = util::query_get(pt_.query_params, "uploadId").value_or("");

  std::vector<multipart::DeclaredPart> parts;
  try {
    std::istringstream is{std::string(body())};
    bpt::ptree tree;
    bpt::read_xml(is, tree);
    const auto& root = tree.get_child("CompleteMultipartUpload");
    for (const auto& child : root) {
      if (child.first != "Part") continue;
      multipart::DeclaredPart p;
      p.part_number = child.second.get<std::uint32_t>("PartNumber");
      p.etag = child.second.get<std::string>("ETag");
      parts.push_back(std::move(p));
    }
  } catch (const bpt::ptree_error& e) {
    logging::server()->debug("request {}: malformed CompleteMultipartUpload: {}", request_id_, e.what());
    return error(http::status::bad_request, "MalformedXML",
                 "The XML you provided was not well-formed or did not validate against our published schema.");
  }

  storage::ObjectMeta meta;
  storage::Error err;
  if (!uploads_->complete(pt_.bucket, pt_.key, upload_id, parts, &meta, &err)) {
    return storage_error(err);
  }

  std::ostringstream oss;
  oss << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>"
      << "<CompleteMultipartUploadResult xmlns=\"" << kXmlns << "\">"
      << "<Location>/" << xml_escape(pt_.bucket) << "/" << xml_escape(pt_.key) << "</Location>"
      << "<Bucket>" << xml_escape(pt_.bucket) << "</Bucket>"
      << "<Key>" << xml_escape(pt_.key) << "</Key>"
      << "<ETag>" << xml_escape(meta.etag) << "</ETag>"
      << "</CompleteMultipartUploadResult>";
  return xml(http::status::ok, oss.str());
}

Response Exchange::abort_upload() {
  const std::string upload_id = util::query_get(pt_.query_params, "uploadId").value_or("");
  storage::Error err;
  if (!uploads_->abort(pt_.bucket, pt_.key, upload_id, &err)) return storage_error(err);
  return empty(http::status::no_content);
}

} // namespace

Response make_error(const Request& req, http::status st, std::string_view code, std::string_view message) {
  // Routing state is never consulted when rejecting.
  static const Snapshot kNoConfig{config::Config{}};
  Exchange ex(req, kNoConfig, nullptr, nullptr);
  return ex.reject(st, code, message);
}

Api::Api(storage::FsObjectStore* store,
         multipart::Coordinator* uploads,
         std::shared_ptr<const Snapshot> snapshot)
    : store_(store), uploads_(uploads), snapshot_(std::move(snapshot)) {}

std::shared_ptr<const Snapshot> Api::snapshot() const {
  return std::atomic_load(&snapshot_);
}

void Api::reload(std::shared_ptr<const Snapshot> next) {
  auto current = snapshot();
  if (current && next->config.storage.location != current->config.storage.location) {
    logging::server()->warn("storage.location cannot change at runtime; keeping {}",
                            current->config.storage.location);
    config::Config patched = next->config;
    patched.storage.location = current->config.storage.location;
    next = std::make_shared<const Snapshot>(std::move(patched));
  }
  uploads_->set_expiry(static_cast<std::int64_t>(next->config.multipart.expiry_seconds));
  logging::apply_levels(next->config.logging);
  std::atomic_store(&snapshot_, std::move(next));
  logging::server()->info("configuration reloaded");
}

Response Api::handle(const Request& req) {
  auto snap = snapshot();
  Exchange ex(req, *snap, store_, uploads_);
  return ex.run();
}

} // namespace s3
