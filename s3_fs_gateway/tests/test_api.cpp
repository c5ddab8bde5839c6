#include "http_server.hpp"
#include "meta_index.hpp"
#include "metrics.hpp"
#include "multipart.hpp"
#include "s3_api.hpp"
#include "sigv4.hpp"
#include "storage.hpp"
#include "util.hpp"

#include <cassert>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;
namespace http = boost::beast::http;

static const char* kAmzDate = "20130524T000000Z";

static std::string make_tmp_dir() {
  std::string tmpl = "/tmp/s3fs_test_XXXXXX";
  std::vector<char> buf(tmpl.begin(), tmpl.end());
  buf.push_back('\0');
  char* dir = mkdtemp(buf.data());
  assert(dir != nullptr);
  return std::string(dir);
}

static config::Credential credential(const std::string& ak, const std::string& sk,
                                     std::vector<config::Permission> perms) {
  config::Credential c;
  c.access_key = ak;
  c.secret_key = sk;
  c.permissions = std::move(perms);
  return c;
}

// Unsigned request with the headers every client sends.
static s3::Request make_request(http::verb verb, const std::string& target, const std::string& body = "") {
  s3::Request req{verb, target, 11};
  req.set(http::field::host, "localhost:8088");
  req.set("x-amz-date", kAmzDate);
  req.set("x-amz-content-sha256", util::sha256_hex(body));
  req.body().assign(body.begin(), body.end());
  req.prepare_payload();
  return req;
}

static void sign(s3::Request* req, const std::string& ak, const std::string& sk) {
  auth::SignedRequest sreq;
  sreq.method = std::string(req->method_string().data(), req->method_string().size());
  sreq.target = std::string(req->target().data(), req->target().size());
  sreq.headers = s3::collect_headers(*req);
  sreq.payload = std::string_view(req->body().data(), req->body().size());

  const std::vector<std::string> signed_headers = {"host", "x-amz-content-sha256", "x-amz-date"};
  auto creq = auth::canonical_request(sreq, signed_headers, sreq.headers.at("x-amz-content-sha256"), false);
  assert(creq);
  const std::string sig = auth::compute_signature(sk, "20130524", "us-east-1", "s3", kAmzDate, *creq);
  req->set(http::field::authorization,
           "AWS4-HMAC-SHA256 Credential=" + ak +
               "/20130524/us-east-1/s3/aws4_request, SignedHeaders=host;x-amz-content-sha256;x-amz-date, Signature=" +
               sig);
}

static std::string body_of(const s3::Response& res) {
  return std::string(res.body().begin(), res.body().end());
}

static std::string header_of(const s3::Response& res, http::field f) {
  auto v = res[f];
  return std::string(v.data(), v.size());
}

static bool contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

static std::string between(const std::string& s, const std::string& open, const std::string& close) {
  auto a = s.find(open);
  if (a == std::string::npos) return {};
  a += open.size();
  auto b = s.find(close, a);
  if (b == std::string::npos) return {};
  return s.substr(a, b - a);
}

struct Gateway {
  explicit Gateway(const std::string& dir) {
    fs::create_directories(dir + "/.s3fs");
    storage::Error err;
    index = storage::MetaIndex::open(dir + "/.s3fs/meta", nullptr, &err);
    assert(index);
    store = std::make_unique<storage::FsObjectStore>(dir, index.get());
    uploads = std::make_unique<multipart::Coordinator>(store.get(), index.get(), 3600);

    config::Config cfg;
    cfg.storage.location = dir;
    cfg.server.max_object_bytes = 1024;
    cfg.credentials.push_back(credential("admin", "admin-secret", {{"*", "*"}}));
    cfg.credentials.push_back(credential("reader", "reader-secret", {{"GetObject", "photos/*"}}));
    api = std::make_unique<s3::Api>(store.get(), uploads.get(), std::make_shared<const s3::Snapshot>(cfg));
  }

  s3::Response as(const std::string& ak, const std::string& sk, s3::Request req) {
    sign(&req, ak, sk);
    return api->handle(req);
  }
  s3::Response admin(s3::Request req) { return as("admin", "admin-secret", std::move(req)); }

  std::unique_ptr<storage::MetaIndex> index;
  std::unique_ptr<storage::FsObjectStore> store;
  std::unique_ptr<multipart::Coordinator> uploads;
  std::unique_ptr<s3::Api> api;
};

static void test_object_lifecycle(Gateway& gw, const std::string& dir) {
  auto res = gw.admin(make_request(http::verb::get, "/"));
  assert(res.result() == http::status::ok);
  assert(contains(body_of(res), "<Buckets></Buckets>"));
  assert(header_of(res, http::field::server) == "s3_fs_gateway");
  const std::string first_id = std::string(res["x-amz-request-id"].data(), res["x-amz-request-id"].size());
  assert(first_id.size() == 16);

  res = gw.admin(make_request(http::verb::put, "/photos"));
  assert(res.result() == http::status::ok);
  assert(header_of(res, http::field::location) == "/photos");
  assert(fs::is_directory(dir + "/photos"));
  const std::string second_id = std::string(res["x-amz-request-id"].data(), res["x-amz-request-id"].size());
  assert(second_id != first_id);

  res = gw.admin(make_request(http::verb::put, "/photos"));
  assert(res.result() == http::status::conflict);
  assert(contains(body_of(res), "<Code>BucketAlreadyExists</Code>"));

  auto put = make_request(http::verb::put, "/photos/2024/cat.txt", "ABC");
  put.set(http::field::content_type, "text/plain");
  res = gw.admin(std::move(put));
  assert(res.result() == http::status::ok);
  assert(header_of(res, http::field::etag) == "\"" + util::sha256_hex("ABC") + "\"");

  res = gw.admin(make_request(http::verb::get, "/photos/2024/cat.txt"));
  assert(res.result() == http::status::ok);
  assert(body_of(res) == "ABC");
  assert(header_of(res, http::field::content_type) == "text/plain");
  assert(header_of(res, http::field::accept_ranges) == "bytes");
  assert(!header_of(res, http::field::last_modified).empty());

  res = gw.admin(make_request(http::verb::head, "/photos/2024/cat.txt"));
  assert(res.result() == http::status::ok);
  assert(res.body().empty());
  assert(header_of(res, http::field::content_length) == "3");

  res = gw.admin(make_request(http::verb::head, "/photos"));
  assert(res.result() == http::status::ok);
  res = gw.admin(make_request(http::verb::head, "/nosuchbucket"));
  assert(res.result() == http::status::not_found);

  res = gw.admin(make_request(http::verb::get, "/photos?list-type=2&delimiter=%2F"));
  assert(res.result() == http::status::ok);
  assert(contains(body_of(res), "<CommonPrefixes><Prefix>2024/</Prefix></CommonPrefixes>"));
  assert(contains(body_of(res), "<KeyCount>1</KeyCount>"));

  res = gw.admin(make_request(http::verb::get, "/photos?prefix=2024%2F"));
  assert(res.result() == http::status::ok);
  assert(contains(body_of(res), "<Key>2024/cat.txt</Key>"));
  assert(contains(body_of(res), "<Size>3</Size>"));
  assert(contains(body_of(res), "<IsTruncated>false</IsTruncated>"));

  res = gw.admin(make_request(http::verb::get, "/"));
  assert(contains(body_of(res), "<Name>photos</Name>"));

  res = gw.admin(make_request(http::verb::get, "/photos/missing.txt"));
  assert(res.result() == http::status::not_found);
  assert(contains(body_of(res), "<Code>NoSuchKey</Code>"));
  assert(contains(body_of(res), "<Resource>/photos/missing.txt</Resource>"));

  res = gw.admin(make_request(http::verb::get, "/photos/..%2F..%2Fetc%2Fpasswd"));
  assert(res.result() == http::status::bad_request);

  res = gw.admin(make_request(http::verb::put, "/photos/2024"));
  assert(res.result() == http::status::conflict);
  assert(contains(body_of(res), "<Code>PathConflict</Code>"));

  res = gw.admin(make_request(http::verb::delete_, "/photos"));
  assert(res.result() == http::status::conflict);
  assert(contains(body_of(res), "<Code>BucketNotEmpty</Code>"));

  res = gw.admin(make_request(http::verb::delete_, "/photos/2024/cat.txt"));
  assert(res.result() == http::status::no_content);
  res = gw.admin(make_request(http::verb::delete_, "/photos/2024/cat.txt"));
  assert(res.result() == http::status::no_content);
  assert(!fs::exists(dir + "/photos/2024"));
}

static void test_rejections(Gateway& gw) {
  auto res = gw.api->handle(make_request(http::verb::get, "/"));
  assert(res.result() == http::status::forbidden);
  assert(contains(body_of(res), "<Code>AccessDenied</Code>"));

  auto tampered = make_request(http::verb::get, "/");
  sign(&tampered, "admin", "admin-secret");
  std::string authz(tampered[http::field::authorization].data(), tampered[http::field::authorization].size());
  authz.back() = authz.back() == '0' ? '1' : '0';
  tampered.set(http::field::authorization, authz);
  res = gw.api->handle(tampered);
  assert(res.result() == http::status::forbidden);
  assert(contains(body_of(res), "<Code>SignatureDoesNotMatch</Code>"));

  res = gw.as("nobody", "x", make_request(http::verb::get, "/"));
  assert(res.result() == http::status::forbidden);
  assert(contains(body_of(res), "<Code>InvalidAccessKeyId</Code>"));

  // The reader may only get objects under photos/.
  res = gw.as("reader", "reader-secret", make_request(http::verb::put, "/photos/new.txt", "x"));
  assert(res.result() == http::status::forbidden);
  assert(contains(body_of(res), "<Code>AccessDenied</Code>"));
  res = gw.as("reader", "reader-secret", make_request(http::verb::get, "/photos/new.txt"));
  assert(res.result() == http::status::not_found);

  res = gw.admin(make_request(http::verb::patch, "/photos/x"));
  assert(res.result() == http::status::method_not_allowed);

  res = gw.admin(make_request(http::verb::get, "/photos/%zz"));
  assert(res.result() == http::status::bad_request);
  assert(contains(body_of(res), "<Code>InvalidURI</Code>"));

  res = gw.admin(make_request(http::verb::put, "/photos/big.bin", std::string(2048, 'x')));
  assert(res.result() == http::status::payload_too_large);

  auto copy = make_request(http::verb::put, "/photos/copy.txt");
  copy.set("x-amz-copy-source", "/photos/new.txt");
  res = gw.admin(std::move(copy));
  assert(res.result() == http::status::not_implemented);

  res = gw.admin(make_request(http::verb::get, "/photos?list-type=2&continuation-token=%21%21"));
  assert(res.result() == http::status::bad_request);

  res = gw.admin(make_request(http::verb::put, "/Bad_Bucket"));
  assert(res.result() == http::status::bad_request);
  assert(contains(body_of(res), "<Code>InvalidBucketName</Code>"));

  auto big = make_request(http::verb::put, "/photos/x");
  auto rejected = s3::make_error(big, http::status::payload_too_large, "EntityTooLarge", "too large");
  assert(rejected.result() == http::status::payload_too_large);
  assert(contains(body_of(rejected), "<Resource>/photos/x</Resource>"));
}

static void test_builtin_endpoints() {
  // Unsigned requests; answered without consulting credentials.
  auto health = server::serve_builtin(make_request(http::verb::get, "/healthz"), nullptr);
  assert(health);
  assert(health->result() == http::status::ok);
  assert(header_of(*health, http::field::content_type) == "text/plain");
  assert(body_of(*health) == "ok");

  server::Metrics metrics;
  metrics.Observe("GET", 200, 0, 2, 1.5);
  auto scrape = server::serve_builtin(make_request(http::verb::get, "/metrics"), &metrics);
  assert(scrape);
  assert(scrape->result() == http::status::ok);
  assert(contains(body_of(*scrape), "s3fs_requests_total{method=\"GET\"} 1\n"));

  assert(!server::serve_builtin(make_request(http::verb::post, "/healthz"), nullptr));
  assert(!server::serve_builtin(make_request(http::verb::get, "/healthz/x"), nullptr));
  assert(!server::serve_builtin(make_request(http::verb::get, "/photos"), nullptr));
}

static void test_multipart(Gateway& gw) {
  auto res = gw.admin(make_request(http::verb::post, "/photos/movie.mp4?uploads"));
  assert(res.result() == http::status::ok);
  const std::string upload_id = between(body_of(res), "<UploadId>", "</UploadId>");
  assert(upload_id.size() == 32);
  const std::string base = "/photos/movie.mp4?uploadId=" + upload_id;

  res = gw.admin(make_request(http::verb::put, base + "&partNumber=2", "BB"));
  assert(res.result() == http::status::ok);
  const std::string etag2 = header_of(res, http::field::etag);
  res = gw.admin(make_request(http::verb::put, "/photos/movie.mp4?partNumber=1&uploadId=" + upload_id, "AA"));
  assert(res.result() == http::status::ok);
  const std::string etag1 = header_of(res, http::field::etag);

  res = gw.admin(make_request(http::verb::put, base + "&partNumber=abc", "CC"));
  assert(res.result() == http::status::bad_request);

  res = gw.admin(make_request(http::verb::post, base, "<CompleteMultipartUpload><Part>"));
  assert(res.result() == http::status::bad_request);
  assert(contains(body_of(res), "<Code>MalformedXML</Code>"));

  const std::string out_of_order =
      "<CompleteMultipartUpload>"
      "<Part><PartNumber>2</PartNumber><ETag>" + etag2 + "</ETag></Part>"
      "<Part><PartNumber>1</PartNumber><ETag>" + etag1 + "</ETag></Part>"
      "</CompleteMultipartUpload>";
  res = gw.admin(make_request(http::verb::post, base, out_of_order));
  assert(res.result() == http::status::bad_request);
  assert(contains(body_of(res), "<Code>InvalidPartOrder</Code>"));

  const std::string manifest =
      "<CompleteMultipartUpload>"
      "<Part><PartNumber>1</PartNumber><ETag>" + etag1 + "</ETag></Part>"
      "<Part><PartNumber>2</PartNumber><ETag>" + etag2 + "</ETag></Part>"
      "</CompleteMultipartUpload>";
  res = gw.admin(make_request(http::verb::post, base, manifest));
  assert(res.result() == http::status::ok);
  assert(contains(body_of(res), "-2&quot;</ETag>"));

  res = gw.admin(make_request(http::verb::get, "/photos/movie.mp4"));
  assert(body_of(res) == "AABB");
  assert(header_of(res, http::field::content_type) == "video/mp4");

  res = gw.admin(make_request(http::verb::post, base, manifest));
  assert(res.result() == http::status::not_found);
  assert(contains(body_of(res), "<Code>NoSuchUpload</Code>"));

  res = gw.admin(make_request(http::verb::post, "/photos/other.bin?uploads"));
  const std::string abort_id = between(body_of(res), "<UploadId>", "</UploadId>");
  res = gw.admin(make_request(http::verb::delete_, "/photos/other.bin?uploadId=" + abort_id));
  assert(res.result() == http::status::no_content);
  res = gw.admin(make_request(http::verb::delete_, "/photos/other.bin?uploadId=" + abort_id));
  assert(res.result() == http::status::no_content);
}

static void test_reload(Gateway& gw, const std::string& dir) {
  config::Config cfg;
  cfg.storage.location = dir + "/elsewhere";
  cfg.multipart.expiry_seconds = 60;
  cfg.credentials.push_back(credential("admin", "admin-secret", {{"*", "*"}}));
  gw.api->reload(std::make_shared<const s3::Snapshot>(cfg));

  assert(gw.api->snapshot()->config.storage.location == dir);
  assert(gw.uploads->expiry() == 60);

  auto res = gw.as("reader", "reader-secret", make_request(http::verb::get, "/photos/movie.mp4"));
  assert(res.result() == http::status::forbidden);
  assert(contains(body_of(res), "<Code>InvalidAccessKeyId</Code>"));
  res = gw.admin(make_request(http::verb::get, "/photos/movie.mp4"));
  assert(res.result() == http::status::ok);
}

int main() {
  std::string dir = make_tmp_dir();
  {
    Gateway gw(dir);
    test_object_lifecycle(gw, dir);
    test_rejections(gw);
    test_multipart(gw);
    test_reload(gw, dir);
    test_builtin_endpoints();
  }
  fs::remove_all(dir);
  std::cout << "test_api passed\n";
  return 0;
}
