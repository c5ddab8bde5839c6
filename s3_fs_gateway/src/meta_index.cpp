#include "meta_index.hpp"
#include "metrics.hpp"

#include <rocksdb/options.h>

#include <charconv>
#include <chrono>
#include <cstdio>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace storage {

static void append_field(std::string* k, std::string_view field) {
  k->append(field.data(), field.size());
  k->push_back('\0');
}

static std::string tagged(char tag) {
  std::string k;
  k.push_back(tag);
  k.push_back('\0');
  return k;
}

static std::string object_key(std::string_view bucket, std::string_view key) {
  std::string k = tagged('M');
  append_field(&k, bucket);
  k.append(key.data(), key.size());
  return k;
}

static std::string bucket_prefix(std::string_view bucket) {
  std::string k = tagged('M');
  append_field(&k, bucket);
  return k;
}

static std::string upload_key(std::string_view upload_id) {
  std::string k = tagged('U');
  k.append(upload_id.data(), upload_id.size());
  return k;
}

static std::string part_prefix(std::string_view upload_id) {
  std::string k = tagged('P');
  append_field(&k, upload_id);
  return k;
}

static std::string part_key(std::string_view upload_id, std::uint32_t part_number) {
  char num[16];
  std::snprintf(num, sizeof(num), "%05u", part_number);
  return part_prefix(upload_id) + num;
}

static std::vector<std::string_view> split_fields(std::string_view v, size_t n) {
  std::vector<std::string_view> out;
  for (size_t i = 0; i + 1 < n; ++i) {
    size_t p = v.find('\0');
    if (p == std::string_view::npos) return {};
    out.push_back(v.substr(0, p));
    v.remove_prefix(p + 1);
  }
  out.push_back(v);
  return out;
}

template <typename Int>
static bool parse_int(std::string_view s, Int* out) {
  Int val = 0;
  auto res = std::from_chars(s.data(), s.data() + s.size(), val);
  if (res.ec != std::errc{} || res.ptr != s.data() + s.size()) return false;
  *out = val;
  return true;
}

static std::string join_fields(std::initializer_list<std::string_view> fields) {
  std::string out;
  bool first = true;
  for (auto f : fields) {
    if (!first) out.push_back('\0');
    first = false;
    out.append(f.data(), f.size());
  }
  return out;
}

// size\0mtime_ns\0ino\0etag\0content_type
static std::string encode_object(const ObjectRecord& m) {
  return join_fields({std::to_string(m.size), std::to_string(m.mtime_ns), std::to_string(m.ino),
                      m.etag, m.content_type});
}

static std::optional<ObjectRecord> decode_object(std::string_view v) {
  auto f = split_fields(v, 5);
  if (f.size() != 5) return std::nullopt;
  ObjectRecord m;
  if (!parse_int(f[0], &m.size) || !parse_int(f[1], &m.mtime_ns) || !parse_int(f[2], &m.ino)) {
    return std::nullopt;
  }
  m.etag = std::string(f[3]);
  m.content_type = std::string(f[4]);
  return m;
}

// bucket\0key\0created_at\0content_type
static std::string encode_upload(const UploadRecord& u) {
  return join_fields({u.bucket, u.key, std::to_string(u.created_at), u.content_type});
}

static std::optional<UploadRecord> decode_upload(std::string_view id, std::string_view v) {
  auto f = split_fields(v, 4);
  if (f.size() != 4) return std::nullopt;
  UploadRecord u;
  u.upload_id = std::string(id);
  u.bucket = std::string(f[0]);
  u.key = std::string(f[1]);
  if (!parse_int(f[2], &u.created_at)) return std::nullopt;
  u.content_type = std::string(f[3]);
  return u;
}

// etag\0size
static std::string encode_part(const PartRecord& p) {
  return join_fields({p.etag, std::to_string(p.size)});
}

static std::optional<PartRecord> decode_part(std::string_view num, std::string_view v) {
  auto f = split_fields(v, 2);
  if (f.size() != 2) return std::nullopt;
  PartRecord p;
  if (!parse_int(num, &p.part_number)) return std::nullopt;
  p.etag = std::string(f[0]);
  if (!parse_int(f[1], &p.size)) return std::nullopt;
  return p;
}

MetaIndex::MetaIndex(std::unique_ptr<rocksdb::DB> db, server::Metrics* metrics)
    : db_(std::move(db)), metrics_(metrics) {
  // Upload and object records must survive a crash once acknowledged.
  wo_.sync = true;
}

std::unique_ptr<MetaIndex> MetaIndex::open(const std::string& path,
                                           server::Metrics* metrics,
                                           Error* err) {
  rocksdb::Options options;
  options.create_if_missing = true;
  options.IncreaseParallelism();

  rocksdb::DB* db = nullptr;
  const rocksdb::Status st = rocksdb::DB::Open(options, path, &db);
  if (!st.ok()) {
    fail(err, ErrorCode::IoFailure, "Failed to open metadata index at " + path + ": " + st.ToString());
    return nullptr;
  }
  return std::make_unique<MetaIndex>(std::unique_ptr<rocksdb::DB>(db), metrics);
}

void MetaIndex::observe(const rocksdb::Status& st, std::size_t bytes, Clock::time_point start) {
  if (metrics_ == nullptr) return;
  const double ms = std::chrono::duration<double, std::milli>(Clock::now() - start).count();
  metrics_->ObserveStorage("index", st.ok() || st.IsNotFound(), bytes, ms);
}

rocksdb::Status MetaIndex::scan(const std::string& prefix, const Visitor& visit) {
  std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(rocksdb::ReadOptions{}));
  it->Seek(prefix);
  while (it->Valid() && it->key().starts_with(prefix)) {
    const rocksdb::Slice k = it->key();
    const rocksdb::Slice v = it->value();
    if (!visit(std::string_view(k.data() + prefix.size(), k.size() - prefix.size()),
               std::string_view(v.data(), v.size()))) {
      break;
    }
    it->Next();
  }
  return it->status();
}

rocksdb::Status MetaIndex::collect_deletes(const std::string& prefix, rocksdb::WriteBatch* batch) {
  return scan(prefix, [&](std::string_view suffix, std::string_view) {
    batch->Delete(prefix + std::string(suffix));
    return true;
  });
}

bool MetaIndex::commit(rocksdb::WriteBatch* batch, Clock::time_point start, Error* err) {
  const rocksdb::Status st = db_->Write(wo_, batch);
  observe(st, batch->GetDataSize(), start);
  if (!st.ok()) return fail(err, ErrorCode::IoFailure, st.ToString());
  return true;
}

bool MetaIndex::get_object(std::string_view bucket, std::string_view key, ObjectRecord* out, Error* err) {
  const auto start = Clock::now();
  std::string value;
  const rocksdb::Status st = db_->Get(rocksdb::ReadOptions{}, object_key(bucket, key), &value);
  observe(st, value.size(), start);
  if (st.IsNotFound()) return fail(err, ErrorCode::NoSuchKey, "No record");
  if (!st.ok()) return fail(err, ErrorCode::IoFailure, st.ToString());
  auto rec = decode_object(value);
  if (!rec) return fail(err, ErrorCode::IoFailure, "Corrupt object record");
  if (out) *out = std::move(*rec);
  return true;
}

bool MetaIndex::put_object(std::string_view bucket, std::string_view key, const ObjectRecord& rec, Error* err) {
  const auto start = Clock::now();
  rocksdb::WriteBatch batch;
  batch.Put(object_key(bucket, key), encode_object(rec));
  return commit(&batch, start, err);
}

bool MetaIndex::delete_object(std::string_view bucket, std::string_view key, Error* err) {
  const auto start = Clock::now();
  rocksdb::WriteBatch batch;
  batch.Delete(object_key(bucket, key));
  return commit(&batch, start, err);
}

bool MetaIndex::delete_bucket(std::string_view bucket, Error* err) {
  const auto start = Clock::now();
  rocksdb::WriteBatch batch;
  const rocksdb::Status st = collect_deletes(bucket_prefix(bucket), &batch);
  if (!st.ok()) {
    observe(st, 0, start);
    return fail(err, ErrorCode::IoFailure, st.ToString());
  }
  return commit(&batch, start, err);
}

bool MetaIndex::put_upload(const UploadRecord& rec, Error* err) {
  const auto start = Clock::now();
  rocksdb::WriteBatch batch;
  batch.Put(upload_key(rec.upload_id), encode_upload(rec));
  return commit(&batch, start, err);
}

bool MetaIndex::get_upload(std::string_view upload_id, UploadRecord* out, Error* err) {
  const auto start = Clock::now();
  std::string value;
  const rocksdb::Status st = db_->Get(rocksdb::ReadOptions{}, upload_key(upload_id), &value);
  observe(st, value.size(), start);
  if (st.IsNotFound()) return fail(err, ErrorCode::NoSuchUpload, "The specified upload does not exist");
  if (!st.ok()) return fail(err, ErrorCode::IoFailure, st.ToString());
  auto rec = decode_upload(upload_id, value);
  if (!rec) return fail(err, ErrorCode::IoFailure, "Corrupt upload record");
  if (out) *out = std::move(*rec);
  return true;
}

std::vector<UploadRecord> MetaIndex::list_uploads(Error* err) {
  const auto start = Clock::now();
  std::vector<UploadRecord> out;
  const rocksdb::Status st = scan(tagged('U'), [&](std::string_view id, std::string_view value) {
    // Undecodable records are skipped.
    if (auto rec = decode_upload(id, value)) out.push_back(std::move(*rec));
    return true;
  });
  observe(st, 0, start);
  if (!st.ok()) fail(err, ErrorCode::IoFailure, st.ToString());
  return out;
}

bool MetaIndex::put_part(std::string_view upload_id, const PartRecord& part, Error* err) {
  const auto start = Clock::now();
  rocksdb::WriteBatch batch;
  batch.Put(part_key(upload_id, part.part_number), encode_part(part));
  return commit(&batch, start, err);
}

bool MetaIndex::list_parts(std::string_view upload_id, std::vector<PartRecord>* out, Error* err) {
  const auto start = Clock::now();
  bool corrupt = false;
  const rocksdb::Status st = scan(part_prefix(upload_id), [&](std::string_view num, std::string_view value) {
    auto part = decode_part(num, value);
    if (!part) {
      corrupt = true;
      return false;
    }
    if (out) out->push_back(std::move(*part));
    return true;
  });
  observe(st, 0, start);
  if (!st.ok()) return fail(err, ErrorCode::IoFailure, st.ToString());
  if (corrupt) return fail(err, ErrorCode::IoFailure, "Corrupt part record");
  return true;
}

bool MetaIndex::delete_upload(std::string_view upload_id, Error* err) {
  const auto start = Clock::now();
  rocksdb::WriteBatch batch;
  batch.Delete(upload_key(upload_id));
  const rocksdb::Status st = collect_deletes(part_prefix(upload_id), &batch);
  if (!st.ok()) {
    observe(st, 0, start);
    return fail(err, ErrorCode::IoFailure, st.ToString());
  }
  return commit(&batch, start, err);
}

} // namespace storage
