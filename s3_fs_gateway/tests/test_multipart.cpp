#include "meta_index.hpp"
#include "multipart.hpp"
#include "storage.hpp"
#include "util.hpp"

#include <cassert>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <atomic>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

static std::string make_tmp_dir() {
  std::string tmpl = "/tmp/s3fs_test_XXXXXX";
  std::vector<char> buf(tmpl.begin(), tmpl.end());
  buf.push_back('\0');
  char* dir = mkdtemp(buf.data());
  assert(dir != nullptr);
  return std::string(dir);
}

static bool ends_with(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// complete, abort and an expiring sweep race on one upload. At most one of
// complete and sweep transitions it; whatever wins, the upload ends up gone.
static void test_terminal_race(storage::FsObjectStore& store, multipart::Coordinator& uploads) {
  for (int round = 0; round < 20; ++round) {
    const std::string key = "race/terminal-" + std::to_string(round);
    storage::Error err;
    std::string id, etag;
    assert(uploads.initiate("media", key, "", &id, &err));
    assert(uploads.upload_part("media", key, id, 1, "payload", &etag, &err));

    std::atomic<bool> completed{false};
    std::atomic<bool> aborted{false};
    std::atomic<std::size_t> expired{0};
    const std::int64_t later = util::unix_now_seconds() + uploads.expiry() + 1;

    std::thread c([&] {
      storage::Error e;
      storage::ObjectMeta meta;
      if (uploads.complete("media", key, id, {{1, etag}}, &meta, &e)) {
        completed = true;
      } else {
        assert(e.code == storage::ErrorCode::NoSuchUpload);
      }
    });
    std::thread a([&] {
      storage::Error e;
      aborted = uploads.abort("media", key, id, &e);
    });
    std::thread s([&] { expired = uploads.sweep(later); });
    c.join();
    a.join();
    s.join();

    assert(aborted);
    assert((completed ? 1 : 0) + expired.load() <= 1);
    assert(!fs::exists(uploads.staging_dir(id)));

    std::string unused;
    assert(!uploads.upload_part("media", key, id, 2, "late", &unused, &err));
    assert(err.code == storage::ErrorCode::NoSuchUpload);

    std::string data;
    storage::ObjectMeta got;
    if (completed) {
      assert(store.get_object("media", key, &data, &got, &err));
      assert(data == "payload");
    } else {
      assert(!store.get_object("media", key, &data, &got, &err));
      assert(err.code == storage::ErrorCode::NoSuchKey);
    }
  }
}

// A part re-upload racing complete: the object is built from exactly one of
// the two contents.
static void test_part_overwrite_race(storage::FsObjectStore& store, multipart::Coordinator& uploads) {
  const std::string first(256 * 1024, 'A');
  const std::string second(192 * 1024, 'B');
  for (int round = 0; round < 20; ++round) {
    const std::string key = "race/overwrite-" + std::to_string(round);
    storage::Error err;
    std::string id, etag_first;
    assert(uploads.initiate("media", key, "", &id, &err));
    assert(uploads.upload_part("media", key, id, 1, first, &etag_first, &err));

    bool replaced = false;
    storage::Error part_err;
    std::string etag_second;
    bool completed = false;
    storage::Error complete_err;

    std::thread p([&] { replaced = uploads.upload_part("media", key, id, 1, second, &etag_second, &part_err); });
    std::thread c([&] {
      storage::ObjectMeta meta;
      completed = uploads.complete("media", key, id, {{1, etag_first}}, &meta, &complete_err);
    });
    p.join();
    c.join();

    std::string data;
    storage::ObjectMeta got;
    if (completed) {
      // The overwrite came too late to matter.
      assert(!replaced);
      assert(part_err.code == storage::ErrorCode::NoSuchUpload);
      assert(store.get_object("media", key, &data, &got, &err));
      assert(data == first);
    } else {
      // The overwrite landed first; the stale ETag no longer matches.
      assert(replaced);
      assert(complete_err.code == storage::ErrorCode::InvalidPart);
      storage::ObjectMeta meta;
      assert(uploads.complete("media", key, id, {{1, etag_second}}, &meta, &err));
      assert(store.get_object("media", key, &data, &got, &err));
      assert(data == second);
    }
  }
}

int main() {
  std::string dir = make_tmp_dir();
  fs::create_directories(dir + "/.s3fs");

  storage::Error err;
  auto index = storage::MetaIndex::open(dir + "/.s3fs/meta", nullptr, &err);
  assert(index);
  storage::FsObjectStore store(dir, index.get());
  multipart::Coordinator uploads(&store, index.get(), 3600);
  assert(store.create_bucket("media", &err));

  // Out-of-order part upload, in-order completion.
  std::string id;
  assert(uploads.initiate("media", "video/clip.mp4", "", &id, &err));
  assert(id.size() == 32);
  assert(fs::is_directory(uploads.staging_dir(id)));

  std::string etag1, etag2;
  assert(uploads.upload_part("media", "video/clip.mp4", id, 2, "BB", &etag2, &err));
  assert(uploads.upload_part("media", "video/clip.mp4", id, 1, "AA", &etag1, &err));
  assert(etag1 == "\"" + util::sha256_hex("AA") + "\"");

  // Re-uploading a part replaces it.
  std::string etag1b;
  assert(uploads.upload_part("media", "video/clip.mp4", id, 1, "ZZ", &etag1b, &err));
  assert(uploads.upload_part("media", "video/clip.mp4", id, 1, "AA", &etag1b, &err));
  assert(etag1b == etag1);

  storage::ObjectMeta meta;
  assert(!uploads.complete("media", "video/clip.mp4", id, {{2, etag2}, {1, etag1}}, &meta, &err));
  assert(err.code == storage::ErrorCode::InvalidPartOrder);
  assert(!uploads.complete("media", "video/clip.mp4", id, {}, &meta, &err));
  assert(err.code == storage::ErrorCode::InvalidPart);
  assert(!uploads.complete("media", "video/clip.mp4", id, {{1, etag2}, {2, etag2}}, &meta, &err));
  assert(err.code == storage::ErrorCode::InvalidPart);
  assert(!uploads.complete("media", "video/clip.mp4", id, {{1, etag1}, {3, etag2}}, &meta, &err));
  assert(err.code == storage::ErrorCode::InvalidPart);
  // Wrong key for this upload.
  assert(!uploads.complete("media", "other.mp4", id, {{1, etag1}, {2, etag2}}, &meta, &err));
  assert(err.code == storage::ErrorCode::NoSuchUpload);

  // Unquoted ETags are accepted.
  const std::string bare2 = etag2.substr(1, etag2.size() - 2);
  assert(uploads.complete("media", "video/clip.mp4", id, {{1, etag1}, {2, bare2}}, &meta, &err));
  assert(meta.size == 4);
  assert(ends_with(meta.etag, "-2\""));
  assert(meta.etag == multipart::multipart_etag({etag1, etag2}));
  assert(meta.content_type == "video/mp4");
  assert(!fs::exists(uploads.staging_dir(id)));

  std::string data;
  storage::ObjectMeta got;
  assert(store.get_object("media", "video/clip.mp4", &data, &got, &err));
  assert(data == "AABB");
  assert(got.etag == meta.etag);

  // The upload is gone once completed.
  assert(!uploads.complete("media", "video/clip.mp4", id, {{1, etag1}, {2, etag2}}, &meta, &err));
  assert(err.code == storage::ErrorCode::NoSuchUpload);
  std::string unused;
  assert(!uploads.upload_part("media", "video/clip.mp4", id, 3, "CC", &unused, &err));
  assert(err.code == storage::ErrorCode::NoSuchUpload);

  // Abort
  std::string id2;
  assert(uploads.initiate("media", "big.bin", "application/x-big", &id2, &err));
  assert(id2 != id);
  std::string e;
  assert(uploads.upload_part("media", "big.bin", id2, 1, "data", &e, &err));
  assert(!uploads.upload_part("media", "big.bin", id2, 0, "data", &e, &err));
  assert(err.code == storage::ErrorCode::InvalidArgument);
  assert(!uploads.upload_part("media", "big.bin", id2, 10001, "data", &e, &err));
  assert(err.code == storage::ErrorCode::InvalidArgument);
  assert(!uploads.abort("media", "other.bin", id2, &err));
  assert(err.code == storage::ErrorCode::NoSuchUpload);
  assert(uploads.abort("media", "big.bin", id2, &err));
  assert(!fs::exists(uploads.staging_dir(id2)));
  assert(uploads.abort("media", "big.bin", id2, &err));
  assert(!uploads.complete("media", "big.bin", id2, {{1, e}}, &meta, &err));
  assert(err.code == storage::ErrorCode::NoSuchUpload);
  assert(!store.head_object("media", "big.bin", &got, &err));
  assert(err.code == storage::ErrorCode::NoSuchKey);

  assert(!uploads.upload_part("media", "big.bin", "not-an-id", 1, "x", &e, &err));
  assert(err.code == storage::ErrorCode::NoSuchUpload);

  // Initiation validates the target.
  assert(!uploads.initiate("nosuchbucket", "k", "", &unused, &err));
  assert(err.code == storage::ErrorCode::NoSuchBucket);
  assert(!uploads.initiate("media", "../escape", "", &unused, &err));
  assert(err.code == storage::ErrorCode::InvalidPath);

  // Expiry
  std::string id3;
  assert(uploads.initiate("media", "stale.bin", "", &id3, &err));
  assert(uploads.upload_part("media", "stale.bin", id3, 1, "old", &e, &err));
  const std::int64_t now = util::unix_now_seconds();
  assert(uploads.sweep(now) == 0);
  assert(fs::exists(uploads.staging_dir(id3)));
  assert(uploads.sweep(now + 7200) == 1);
  assert(!fs::exists(uploads.staging_dir(id3)));
  assert(!uploads.complete("media", "stale.bin", id3, {{1, e}}, &meta, &err));
  assert(err.code == storage::ErrorCode::NoSuchUpload);

  // Orphaned staging directories are reclaimed too.
  fs::create_directories(uploads.staging_dir("0123456789abcdef0123456789abcdef"));
  uploads.sweep(now + 7200);
  assert(!fs::exists(uploads.staging_dir("0123456789abcdef0123456789abcdef")));

  test_terminal_race(store, uploads);
  test_part_overwrite_race(store, uploads);

  index.reset();
  fs::remove_all(dir);
  std::cout << "test_multipart passed\n";
  return 0;
}
