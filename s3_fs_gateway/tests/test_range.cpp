#include "meta_index.hpp"
#include "multipart.hpp"
#include "s3_api.hpp"
#include "storage.hpp"
#include "util.hpp"

#include <cassert>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace http = boost::beast::http;

static std::string make_tmp_dir() {
  std::string tmpl = "/tmp/s3fs_test_XXXXXX";
  std::vector<char> buf(tmpl.begin(), tmpl.end());
  buf.push_back('\0');
  char* dir = mkdtemp(buf.data());
  assert(dir != nullptr);
  return std::string(dir);
}

static s3::Request signed_get(const std::string& target, const std::string& range) {
  s3::Request req{http::verb::get, target, 11};
  req.set(http::field::host, "localhost");
  req.set("x-amz-date", "20130524T000000Z");
  req.set(http::field::range, range);

  auth::SignedRequest sreq;
  sreq.method = "GET";
  sreq.target = target;
  sreq.headers = s3::collect_headers(req);
  const std::vector<std::string> signed_headers = {"host", "range", "x-amz-date"};
  auto creq = auth::canonical_request(sreq, signed_headers, util::sha256_hex(""), false);
  assert(creq);
  const std::string sig = auth::compute_signature("secret", "20130524", "us-east-1", "s3",
                                                  "20130524T000000Z", *creq);
  req.set(http::field::authorization,
          "AWS4-HMAC-SHA256 Credential=key/20130524/us-east-1/s3/aws4_request, "
          "SignedHeaders=host;range;x-amz-date, Signature=" + sig);
  return req;
}

static std::string body_of(const s3::Response& res) {
  return std::string(res.body().begin(), res.body().end());
}

static std::string content_range(const s3::Response& res) {
  auto v = res[http::field::content_range];
  return std::string(v.data(), v.size());
}

int main() {
  // Header parsing
  auto r = s3::parse_single_range("bytes=0-3", 8);
  assert(r && r->start == 0 && r->end == 3);
  r = s3::parse_single_range("bytes=4-", 8);
  assert(r && r->start == 4 && r->end == 7);
  r = s3::parse_single_range("bytes=-3", 8);
  assert(r && r->start == 5 && r->end == 7);
  r = s3::parse_single_range("bytes=-100", 8);
  assert(r && r->start == 0 && r->end == 7);
  r = s3::parse_single_range("bytes=2-100", 8);
  assert(r && r->start == 2 && r->end == 7);
  assert(!s3::parse_single_range("bytes=8-9", 8));
  assert(!s3::parse_single_range("bytes=5-2", 8));
  assert(!s3::parse_single_range("bytes=0-1,3-4", 8));
  assert(!s3::parse_single_range("items=0-1", 8));
  assert(!s3::parse_single_range("bytes=-0", 8));
  assert(!s3::parse_single_range("bytes=0-0", 0));

  std::string dir = make_tmp_dir();
  std::filesystem::create_directories(dir + "/.s3fs");

  storage::Error err;
  auto index = storage::MetaIndex::open(dir + "/.s3fs/meta", nullptr, &err);
  assert(index);
  storage::FsObjectStore store(dir, index.get());
  multipart::Coordinator uploads(&store, index.get(), 3600);
  assert(store.create_bucket("pc", &err));

  storage::ObjectMeta meta;
  std::string payload = "ABCDEFGH";
  assert(store.put_object("pc", "obj", payload, "application/octet-stream", &meta, &err));

  config::Config cfg;
  cfg.storage.location = dir;
  config::Credential cred;
  cred.access_key = "key";
  cred.secret_key = "secret";
  cred.permissions.push_back({"GetObject", "pc/*"});
  cfg.credentials.push_back(cred);
  s3::Api api(&store, &uploads, std::make_shared<const s3::Snapshot>(cfg));

  auto res = api.handle(signed_get("/pc/obj", "bytes=0-3"));
  assert(res.result() == http::status::partial_content);
  assert(body_of(res) == "ABCD");
  assert(content_range(res) == "bytes 0-3/8");

  res = api.handle(signed_get("/pc/obj", "bytes=-3"));
  assert(res.result() == http::status::partial_content);
  assert(body_of(res) == "FGH");
  assert(content_range(res) == "bytes 5-7/8");

  res = api.handle(signed_get("/pc/obj", "bytes=6-"));
  assert(res.result() == http::status::partial_content);
  assert(body_of(res) == "GH");

  res = api.handle(signed_get("/pc/obj", "bytes=100-200"));
  assert(res.result() == http::status::range_not_satisfiable);
  assert(content_range(res) == "bytes */8");

  res = api.handle(signed_get("/pc/missing", "bytes=0-3"));
  assert(res.result() == http::status::not_found);

  index.reset();
  std::filesystem::remove_all(dir);
  std::cout << "test_range passed\n";
  return 0;
}
