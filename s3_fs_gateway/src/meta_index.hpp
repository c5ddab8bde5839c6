#pragma once

#include "errors.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <rocksdb/db.h>
#include <rocksdb/write_batch.h>

namespace server {
class Metrics;
} // namespace server

namespace storage {

// Cached attributes of the last successful write of an object. Valid only
// while the file on disk still has the recorded inode, size and mtime.
struct ObjectRecord {
  std::int64_t size = 0;
  std::int64_t mtime_ns = 0;
  std::uint64_t ino = 0;
  std::string etag;         // quoted
  std::string content_type;
};

struct UploadRecord {
  std::string upload_id;
  std::string bucket;
  std::string key;
  std::int64_t created_at = 0; // epoch seconds
  std::string content_type;
};

struct PartRecord {
  std::uint32_t part_number = 0;
  std::string etag;            // quoted
  std::uint64_t size = 0;
};

// RocksDB-backed index of object and multipart records.
class MetaIndex {
public:
  using Clock = std::chrono::steady_clock;

  explicit MetaIndex(std::unique_ptr<rocksdb::DB> db, server::Metrics* metrics = nullptr);

  // Opens (creating if needed) the database at `path`. nullptr on failure.
  static std::unique_ptr<MetaIndex> open(const std::string& path,
                                         server::Metrics* metrics,
                                         Error* err);

  // Objects. get_object reports NoSuchKey when no record exists.
  bool get_object(std::string_view bucket, std::string_view key, ObjectRecord* out, Error* err);
  bool put_object(std::string_view bucket, std::string_view key, const ObjectRecord& rec, Error* err);
  bool delete_object(std::string_view bucket, std::string_view key, Error* err);
  bool delete_bucket(std::string_view bucket, Error* err);

  // Multipart uploads. get_upload reports NoSuchUpload when absent.
  bool put_upload(const UploadRecord& rec, Error* err);
  bool get_upload(std::string_view upload_id, UploadRecord* out, Error* err);
  std::vector<UploadRecord> list_uploads(Error* err);

  bool put_part(std::string_view upload_id, const PartRecord& part, Error* err);
  // Ordered by part number.
  bool list_parts(std::string_view upload_id, std::vector<PartRecord>* out, Error* err);

  // Removes the upload record and all of its part records atomically.
  bool delete_upload(std::string_view upload_id, Error* err);

private:
  // Visits every record under `prefix` in key order. The visitor gets the key
  // with the prefix stripped and returns false to stop early.
  using Visitor = std::function<bool(std::string_view suffix, std::string_view value)>;
  rocksdb::Status scan(const std::string& prefix, const Visitor& visit);

  // Adds a Delete for every key under `prefix` to `batch`.
  rocksdb::Status collect_deletes(const std::string& prefix, rocksdb::WriteBatch* batch);
  bool commit(rocksdb::WriteBatch* batch, Clock::time_point start, Error* err);
  void observe(const rocksdb::Status& st, std::size_t bytes, Clock::time_point start);

  std::unique_ptr<rocksdb::DB> db_;
  rocksdb::WriteOptions wo_;
  server::Metrics* metrics_;
};

} // namespace storage
