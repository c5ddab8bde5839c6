#pragma once

#include "errors.hpp"
#include "meta_index.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace server {
class Metrics;
} // namespace server

namespace storage {

struct ObjectMeta {
  std::string etag;        // quoted hex sha256, or "<hex>-<parts>" for multipart
  std::int64_t mtime = 0;  // epoch seconds
  std::int64_t size = 0;
  std::string content_type;
};

struct ListedObject {
  std::string key;
  ObjectMeta meta;
};

struct BucketInfo {
  std::string name;
  std::int64_t creation_time = 0; // epoch seconds (directory mtime)
};

struct ListResult {
  std::vector<ListedObject> objects;
  std::vector<std::string> common_prefixes;
  bool is_truncated = false;
  std::string next_marker; // last key or common prefix returned, set when truncated
};

// Receives object bytes in order; return false to stop reading early.
using ByteSink = std::function<bool(std::string_view)>;

// Writes the body of a staged object to an open file descriptor.
using BodyWriter = std::function<bool(int fd, Error* err)>;

// Reserved names under the storage root and inside bucket directories.
inline constexpr std::string_view kReservedDir = ".s3fs";
inline constexpr std::string_view kReservedPrefix = ".s3fs-";

// Writes `data` to `dest` through a synced temp file in the same directory,
// then renames it over `dest`.
bool write_file_atomic(const std::filesystem::path& dest, std::string_view data, Error* err);

// Buckets are directories under the root; an object is a regular file at
// <root>/<bucket>/<key>. Object writes stage into a temp file inside the
// bucket directory and rename into place.
class FsObjectStore {
public:
  FsObjectStore(std::filesystem::path root, MetaIndex* index, server::Metrics* metrics = nullptr);

  const std::filesystem::path& root() const { return root_; }

  static bool valid_bucket_name(std::string_view bucket);
  static bool valid_key(std::string_view key);
  // Content type for a key from its extension, application/octet-stream otherwise.
  static std::string content_type_for_key(std::string_view key);

  // Buckets
  bool bucket_exists(std::string_view bucket, Error* err = nullptr);
  bool create_bucket(std::string_view bucket, Error* err);
  bool delete_bucket(std::string_view bucket, Error* err);
  std::vector<BucketInfo> list_buckets(Error* err);

  // Objects
  bool put_object(std::string_view bucket, std::string_view key,
                  std::string_view data,
                  std::string_view content_type,
                  ObjectMeta* out_meta,
                  Error* err);

  // Concatenates `sources` in order into the object, recording `etag` for it.
  bool put_object_from_files(std::string_view bucket, std::string_view key,
                             const std::vector<std::filesystem::path>& sources,
                             std::string_view content_type,
                             std::string_view etag,
                             ObjectMeta* out_meta,
                             Error* err);

  bool get_object(std::string_view bucket, std::string_view key,
                  std::string* out_data,
                  ObjectMeta* out_meta,
                  Error* err);

  // Streams [offset, offset + length) to `sink`. A sink returning false ends
  // the read early without error. length == UINT64_MAX reads to the end.
  bool read_object(std::string_view bucket, std::string_view key,
                   std::uint64_t offset, std::uint64_t length,
                   const ByteSink& sink,
                   ObjectMeta* out_meta,
                   Error* err);

  bool head_object(std::string_view bucket, std::string_view key,
                   ObjectMeta* out_meta,
                   Error* err);

  bool delete_object(std::string_view bucket, std::string_view key,
                     Error* err);

  // Keys in lexicographic order. With a delimiter, keys holding it after the
  // prefix collapse into common prefixes. Resumes strictly after `marker`.
  ListResult list_objects(std::string_view bucket,
                          std::string_view prefix,
                          std::string_view delimiter,
                          std::string_view marker,
                          std::int64_t max_keys,
                          Error* err);

private:
  bool resolve(std::string_view bucket, std::string_view key,
               std::filesystem::path* out, Error* err) const;
  bool commit_object(std::string_view bucket, std::string_view key,
                     const BodyWriter& write_body,
                     std::string_view etag,
                     std::string_view content_type,
                     ObjectMeta* out_meta,
                     Error* err);
  bool describe(std::string_view bucket, std::string_view key, int fd,
                ObjectMeta* out_meta, Error* err);
  void prune_empty_dirs(const std::filesystem::path& bucket_dir, std::filesystem::path dir);
  void observe(std::string_view op, bool ok, std::size_t bytes,
               std::chrono::steady_clock::time_point start);

  std::filesystem::path root_;
  MetaIndex* index_;
  server::Metrics* metrics_;
};

} // namespace storage
