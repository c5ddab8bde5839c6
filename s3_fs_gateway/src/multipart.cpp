#include "multipart.hpp"
#include "logging.hpp"
#include "util.hpp"

#include <sys/stat.h>

#include <cstdio>
#include <map>
#include <system_error>

namespace multipart {

namespace fs = std::filesystem;
using storage::Error;
using storage::ErrorCode;
using storage::fail;

static constexpr std::size_t kUploadIdBytes = 16;

static bool valid_upload_id(std::string_view id) {
  if (id.size() != kUploadIdBytes * 2) return false;
  for (char c : id) {
    if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) return false;
  }
  return true;
}

static std::string_view strip_quotes(std::string_view etag) {
  if (etag.size() >= 2 && etag.front() == '"' && etag.back() == '"') {
    return etag.substr(1, etag.size() - 2);
  }
  return etag;
}

static std::string part_file_name(std::uint32_t part_number) {
  char name[32];
  std::snprintf(name, sizeof(name), "part.%05u", part_number);
  return name;
}

std::string multipart_etag(const std::vector<std::string>& part_etags) {
  std::string digests;
  for (const auto& etag : part_etags) {
    auto raw = util::hex_decode(strip_quotes(etag));
    if (!raw) return {};
    digests.append(reinterpret_cast<const char*>(raw->data()), raw->size());
  }
  return "\"" + util::sha256_hex(digests) + "-" + std::to_string(part_etags.size()) + "\"";
}

Coordinator::Coordinator(storage::FsObjectStore* store,
                         storage::MetaIndex* index,
                         std::int64_t expiry_seconds)
    : store_(store),
      index_(index),
      expiry_seconds_(expiry_seconds),
      staging_root_(store->root() / std::string(storage::kReservedDir) / "multipart") {
  std::error_code ec;
  fs::create_directories(staging_root_, ec);
  if (ec) {
    logging::storage()->error("cannot create multipart staging {}: {}", staging_root_.string(), ec.message());
  }
}

fs::path Coordinator::staging_dir(std::string_view upload_id) const {
  return staging_root_ / std::string(upload_id);
}

std::shared_ptr<Coordinator::UploadLock> Coordinator::acquire(std::string_view upload_id) {
  std::lock_guard<std::mutex> g(locks_mu_);
  auto& slot = locks_[std::string(upload_id)];
  if (!slot) slot = std::make_shared<UploadLock>();
  return slot;
}

// Drops the table entry once the upload reached a terminal state (or never
// existed); later callers get a fresh lock and observe the missing record.
void Coordinator::release(std::string_view upload_id, const std::shared_ptr<UploadLock>& lock) {
  if (!lock->finished) return;
  std::lock_guard<std::mutex> g(locks_mu_);
  auto it = locks_.find(std::string(upload_id));
  if (it != locks_.end() && it->second == lock) locks_.erase(it);
}

bool Coordinator::load_upload(std::string_view bucket, std::string_view key,
                              std::string_view upload_id,
                              storage::UploadRecord* out,
                              bool* missing,
                              Error* err) {
  *missing = false;
  Error lerr;
  if (!index_->get_upload(upload_id, out, &lerr)) {
    *missing = lerr.code == ErrorCode::NoSuchUpload;
    return fail(err, lerr.code, lerr.message);
  }
  if (out->bucket != bucket || out->key != key) {
    return fail(err, ErrorCode::NoSuchUpload, "The specified upload does not exist");
  }
  return true;
}

void Coordinator::destroy(std::string_view upload_id) {
  std::error_code ec;
  fs::remove_all(staging_dir(upload_id), ec);
  if (ec) {
    logging::storage()->warn("failed to remove staging for upload {}: {}", upload_id, ec.message());
  }
}

bool Coordinator::initiate(std::string_view bucket, std::string_view key,
                           std::string_view content_type,
                           std::string* upload_id,
                           Error* err) {
  if (!storage::FsObjectStore::valid_bucket_name(bucket)) {
    return fail(err, ErrorCode::InvalidBucketName, "The specified bucket is not valid");
  }
  if (!storage::FsObjectStore::valid_key(key)) {
    return fail(err, ErrorCode::InvalidPath, "Invalid object key");
  }
  if (!store_->bucket_exists(bucket, err)) return false;

  std::string id = util::random_hex(kUploadIdBytes);
  if (id.empty()) return fail(err, ErrorCode::IoFailure, "random source unavailable");

  fs::path dir = staging_dir(id);
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) return fail(err, ErrorCode::IoFailure, "mkdir " + dir.string() + ": " + ec.message());

  storage::UploadRecord rec;
  rec.upload_id = id;
  rec.bucket = std::string(bucket);
  rec.key = std::string(key);
  rec.created_at = util::unix_now_seconds();
  rec.content_type = std::string(content_type);
  if (!index_->put_upload(rec, err)) {
    destroy(id);
    return false;
  }

  logging::storage()->info("initiated upload {} for {}/{}", id, bucket, key);
  *upload_id = std::move(id);
  return true;
}

bool Coordinator::upload_part(std::string_view bucket, std::string_view key,
                              std::string_view upload_id,
                              std::uint32_t part_number,
                              std::string_view data,
                              std::string* etag,
                              Error* err) {
  if (part_number < kMinPartNumber || part_number > kMaxPartNumber) {
    return fail(err, ErrorCode::InvalidArgument, "Part number must be an integer between 1 and 10000");
  }
  if (!valid_upload_id(upload_id)) {
    return fail(err, ErrorCode::NoSuchUpload, "The specified upload does not exist");
  }

  auto lock = acquire(upload_id);
  bool ok = false;
  {
    std::lock_guard<std::mutex> g(lock->mu);
    storage::UploadRecord rec;
    bool missing = false;
    if (!load_upload(bucket, key, upload_id, &rec, &missing, err)) {
      lock->finished = missing;
    } else {
      fs::path dir = staging_dir(upload_id);
      storage::PartRecord part;
      part.part_number = part_number;
      part.etag = "\"" + util::sha256_hex(data) + "\"";
      part.size = data.size();
      if (storage::write_file_atomic(dir / part_file_name(part_number), data, err) &&
          index_->put_part(upload_id, part, err)) {
        *etag = part.etag;
        ok = true;
      }
    }
  }
  release(upload_id, lock);
  return ok;
}

bool Coordinator::complete(std::string_view bucket, std::string_view key,
                           std::string_view upload_id,
                           const std::vector<DeclaredPart>& parts,
                           storage::ObjectMeta* out_meta,
                           Error* err) {
  if (!valid_upload_id(upload_id)) {
    return fail(err, ErrorCode::NoSuchUpload, "The specified upload does not exist");
  }

  auto lock = acquire(upload_id);
  bool ok = false;
  {
    std::lock_guard<std::mutex> g(lock->mu);
    storage::UploadRecord rec;
    bool missing = false;
    if (!load_upload(bucket, key, upload_id, &rec, &missing, err)) {
      lock->finished = missing;
    } else if (assemble(rec, parts, out_meta, err)) {
      Error ierr;
      if (!index_->delete_upload(upload_id, &ierr)) {
        logging::storage()->warn("failed to drop upload record {}: {}", upload_id, ierr.message);
      }
      destroy(upload_id);
      lock->finished = true;
      ok = true;
      logging::storage()->info("completed upload {} into {}/{} ({} parts)", upload_id, bucket, key, parts.size());
    }
  }
  release(upload_id, lock);
  return ok;
}

bool Coordinator::assemble(const storage::UploadRecord& rec,
                           const std::vector<DeclaredPart>& parts,
                           storage::ObjectMeta* out_meta,
                           Error* err) {
  if (parts.empty()) {
    return fail(err, ErrorCode::InvalidPart, "You must specify at least one part");
  }
  for (std::size_t i = 1; i < parts.size(); ++i) {
    if (parts[i].part_number <= parts[i - 1].part_number) {
      return fail(err, ErrorCode::InvalidPartOrder, "The list of parts was not in ascending order");
    }
  }

  std::vector<storage::PartRecord> staged;
  if (!index_->list_parts(rec.upload_id, &staged, err)) return false;
  std::map<std::uint32_t, const storage::PartRecord*> by_number;
  for (const auto& p : staged) by_number[p.part_number] = &p;

  std::vector<fs::path> sources;
  std::vector<std::string> etags;
  fs::path dir = staging_dir(rec.upload_id);
  for (const auto& declared : parts) {
    auto it = by_number.find(declared.part_number);
    if (it == by_number.end() ||
        strip_quotes(it->second->etag) != strip_quotes(declared.etag)) {
      return fail(err, ErrorCode::InvalidPart,
                  "Part " + std::to_string(declared.part_number) + " was not uploaded or its ETag does not match");
    }
    sources.push_back(dir / part_file_name(declared.part_number));
    etags.push_back(it->second->etag);
  }

  std::string etag = multipart_etag(etags);
  if (etag.empty()) return fail(err, ErrorCode::IoFailure, "Corrupt part record");
  return store_->put_object_from_files(rec.bucket, rec.key, sources, rec.content_type, etag, out_meta, err);
}

bool Coordinator::abort(std::string_view bucket, std::string_view key,
                        std::string_view upload_id,
                        Error* err) {
  if (!valid_upload_id(upload_id)) return true;

  auto lock = acquire(upload_id);
  bool ok = false;
  {
    std::lock_guard<std::mutex> g(lock->mu);
    storage::UploadRecord rec;
    Error lerr;
    if (!index_->get_upload(upload_id, &rec, &lerr)) {
      if (lerr.code == ErrorCode::NoSuchUpload) {
        lock->finished = true;
        ok = true;
      } else {
        fail(err, lerr.code, lerr.message);
      }
    } else if (rec.bucket != bucket || rec.key != key) {
      fail(err, ErrorCode::NoSuchUpload, "The specified upload does not exist");
    } else if (index_->delete_upload(upload_id, err)) {
      destroy(upload_id);
      lock->finished = true;
      ok = true;
      logging::storage()->info("aborted upload {} for {}/{}", upload_id, bucket, key);
    }
  }
  release(upload_id, lock);
  return ok;
}

std::size_t Coordinator::sweep(std::int64_t now) {
  const std::int64_t expiry = expiry_seconds_.load();
  std::size_t reclaimed = 0;

  Error err;
  auto uploads = index_->list_uploads(&err);
  if (err.code != ErrorCode::None) {
    logging::storage()->warn("multipart sweep: listing uploads failed: {}", err.message);
  }

  for (const auto& u : uploads) {
    if (now - u.created_at <= expiry) continue;
    auto lock = acquire(u.upload_id);
    {
      std::lock_guard<std::mutex> g(lock->mu);
      storage::UploadRecord current;
      Error gerr;
      // A concurrent complete or abort may have won.
      if (!index_->get_upload(u.upload_id, &current, &gerr)) {
        lock->finished = gerr.code == ErrorCode::NoSuchUpload;
      } else if (index_->delete_upload(u.upload_id, &gerr)) {
        destroy(u.upload_id);
        lock->finished = true;
        ++reclaimed;
        logging::storage()->info("expired upload {} for {}/{}", u.upload_id, u.bucket, u.key);
      } else {
        logging::storage()->warn("multipart sweep: dropping {} failed: {}", u.upload_id, gerr.message);
      }
    }
    release(u.upload_id, lock);
  }

  // Staging directories whose record never landed or was already dropped.
  std::error_code ec;
  for (fs::directory_iterator it(staging_root_, ec), end; !ec && it != end; it.increment(ec)) {
    std::string id = it->path().filename().string();
    struct stat st {};
    if (::stat(it->path().c_str(), &st) != 0 || !S_ISDIR(st.st_mode)) continue;
    if (now - static_cast<std::int64_t>(st.st_mtim.tv_sec) <= expiry) continue;

    auto lock = acquire(id);
    {
      std::lock_guard<std::mutex> g(lock->mu);
      Error gerr;
      if (!index_->get_upload(id, nullptr, &gerr) && gerr.code == ErrorCode::NoSuchUpload) {
        destroy(id);
        lock->finished = true;
        logging::storage()->info("removed orphaned staging directory {}", id);
      }
    }
    release(id, lock);
  }
  if (ec) logging::storage()->warn("multipart sweep: scanning staging failed: {}", ec.message());

  return reclaimed;
}

} // namespace multipart
