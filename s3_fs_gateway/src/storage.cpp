#include "storage.hpp"
#include "logging.hpp"
#include "metrics.hpp"
#include "util.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace storage {

namespace fs = std::filesystem;

namespace {

using Clock = std::chrono::steady_clock;

constexpr std::size_t kChunkSize = 64 * 1024;
constexpr std::size_t kMaxKeyBytes = 1024;
// Attempts at recreating parents and renaming while deletes prune the same tree.
constexpr int kCommitAttempts = 8;

// Owns a POSIX file descriptor.
class FileHandle {
public:
  explicit FileHandle(int fd = -1) : fd_(fd) {}
  ~FileHandle() {
    if (fd_ >= 0) ::close(fd_);
  }
  FileHandle(const FileHandle&) = delete;
  FileHandle& operator=(const FileHandle&) = delete;

  int get() const { return fd_; }
  bool valid() const { return fd_ >= 0; }

  // close(2) can report deferred write errors, so staged files close explicitly.
  bool close() {
    int fd = fd_;
    fd_ = -1;
    return ::close(fd) == 0;
  }

private:
  int fd_;
};

// Unlinks a staged file unless it was renamed into place.
class TempFileGuard {
public:
  explicit TempFileGuard(fs::path path) : path_(std::move(path)) {}
  ~TempFileGuard() {
    if (armed_) ::unlink(path_.c_str());
  }
  TempFileGuard(const TempFileGuard&) = delete;
  TempFileGuard& operator=(const TempFileGuard&) = delete;

  void release() { armed_ = false; }

private:
  fs::path path_;
  bool armed_ = true;
};

bool io_error(Error* err, const std::string& what, const fs::path& path, int e) {
  return fail(err, ErrorCode::IoFailure, what + " " + path.string() + ": " + std::strerror(e));
}

bool write_all(int fd, std::string_view data, Error* err) {
  while (!data.empty()) {
    ssize_t n = ::write(fd, data.data(), data.size());
    if (n < 0) {
      if (errno == EINTR) continue;
      return fail(err, ErrorCode::IoFailure, std::string("write failed: ") + std::strerror(errno));
    }
    data.remove_prefix(static_cast<std::size_t>(n));
  }
  return true;
}

bool is_transient(int e) {
  return e == EBUSY || e == EAGAIN || e == ETXTBSY;
}

std::int64_t mtime_ns(const struct stat& st) {
  return static_cast<std::int64_t>(st.st_mtim.tv_sec) * 1000000000LL + st.st_mtim.tv_nsec;
}

bool starts_with(std::string_view s, std::string_view prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool is_reserved_segment(std::string_view seg) {
  return starts_with(seg, kReservedPrefix);
}

bool has_reserved_segment(std::string_view rel) {
  size_t pos = 0;
  while (pos <= rel.size()) {
    size_t next = rel.find('/', pos);
    if (next == std::string_view::npos) next = rel.size();
    if (is_reserved_segment(rel.substr(pos, next - pos))) return true;
    pos = next + 1;
  }
  return false;
}

bool hash_fd(int fd, std::string* hex_out, Error* err) {
  util::Sha256 sha;
  if (!sha.ok()) return fail(err, ErrorCode::IoFailure, "sha256 init failed");
  std::string buf(kChunkSize, '\0');
  off_t off = 0;
  for (;;) {
    ssize_t n = ::pread(fd, buf.data(), buf.size(), off);
    if (n < 0) {
      if (errno == EINTR) continue;
      return fail(err, ErrorCode::IoFailure, std::string("read failed: ") + std::strerror(errno));
    }
    if (n == 0) break;
    sha.update(std::string_view(buf.data(), static_cast<std::size_t>(n)));
    off += n;
  }
  *hex_out = sha.final_hex();
  return true;
}

struct ExtensionType {
  const char* ext;
  const char* type;
};

constexpr ExtensionType kContentTypes[] = {
    {".txt", "text/plain"},
    {".htm", "text/html"},
    {".html", "text/html"},
    {".css", "text/css"},
    {".csv", "text/csv"},
    {".js", "application/javascript"},
    {".json", "application/json"},
    {".xml", "application/xml"},
    {".pdf", "application/pdf"},
    {".zip", "application/zip"},
    {".gz", "application/gzip"},
    {".tar", "application/x-tar"},
    {".png", "image/png"},
    {".jpg", "image/jpeg"},
    {".jpeg", "image/jpeg"},
    {".gif", "image/gif"},
    {".svg", "image/svg+xml"},
    {".webp", "image/webp"},
    {".mp3", "audio/mpeg"},
    {".mp4", "video/mp4"},
    {".wasm", "application/wasm"},
};

} // namespace

bool write_file_atomic(const fs::path& dest, std::string_view data, Error* err) {
  std::string suffix = util::random_hex(8);
  if (suffix.empty()) return fail(err, ErrorCode::IoFailure, "random source unavailable");
  fs::path tmp = dest.parent_path() / (std::string(kReservedPrefix) + "tmp." + suffix);

  FileHandle fd(::open(tmp.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644));
  if (!fd.valid()) return io_error(err, "open", tmp, errno);
  TempFileGuard guard(tmp);

  if (!write_all(fd.get(), data, err)) return false;
  if (::fsync(fd.get()) != 0) return io_error(err, "fsync", tmp, errno);
  if (!fd.close()) return io_error(err, "close", tmp, errno);

  int rc = ::rename(tmp.c_str(), dest.c_str());
  if (rc != 0 && is_transient(errno)) rc = ::rename(tmp.c_str(), dest.c_str());
  if (rc != 0) return io_error(err, "rename", dest, errno);
  guard.release();
  return true;
}

FsObjectStore::FsObjectStore(fs::path root, MetaIndex* index, server::Metrics* metrics)
    : root_(std::move(root)), index_(index), metrics_(metrics) {
  std::error_code ec;
  fs::create_directories(root_, ec);
  if (ec) {
    logging::storage()->error("cannot create storage root {}: {}", root_.string(), ec.message());
  }
}

bool FsObjectStore::valid_bucket_name(std::string_view b) {
  if (b.size() < 3 || b.size() > 63) return false;
  auto alnum = [](char c) { return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9'); };
  if (!alnum(b.front()) || !alnum(b.back())) return false;
  char prev = 0;
  for (char c : b) {
    if (!alnum(c) && c != '-' && c != '.') return false;
    if (c == '.' && prev == '.') return false;
    prev = c;
  }
  return true;
}

bool FsObjectStore::valid_key(std::string_view key) {
  if (key.empty() || key.size() > kMaxKeyBytes) return false;
  if (key.find('\0') != std::string_view::npos) return false;
  if (key.front() == '/' || key.back() == '/') return false;

  size_t pos = 0;
  while (pos <= key.size()) {
    size_t next = key.find('/', pos);
    if (next == std::string_view::npos) next = key.size();
    std::string_view seg = key.substr(pos, next - pos);
    if (seg.empty() || seg == "." || seg == ".." || is_reserved_segment(seg)) return false;
    pos = next + 1;
  }
  return true;
}

std::string FsObjectStore::content_type_for_key(std::string_view key) {
  size_t slash = key.rfind('/');
  std::string_view base = slash == std::string_view::npos ? key : key.substr(slash + 1);
  size_t dot = base.rfind('.');
  if (dot != std::string_view::npos && dot > 0) {
    std::string ext = util::to_lower(base.substr(dot));
    for (const auto& entry : kContentTypes) {
      if (ext == entry.ext) return entry.type;
    }
  }
  return "application/octet-stream";
}

void FsObjectStore::observe(std::string_view op, bool ok, std::size_t bytes, Clock::time_point start) {
  if (!metrics_) return;
  double ms = std::chrono::duration<double, std::milli>(Clock::now() - start).count();
  metrics_->ObserveStorage(op, ok, bytes, ms);
}

bool FsObjectStore::bucket_exists(std::string_view bucket, Error* err) {
  if (!valid_bucket_name(bucket)) {
    return fail(err, ErrorCode::InvalidBucketName, "The specified bucket is not valid");
  }
  struct stat st {};
  fs::path dir = root_ / std::string(bucket);
  if (::stat(dir.c_str(), &st) != 0) {
    if (errno == ENOENT || errno == ENOTDIR) {
      return fail(err, ErrorCode::NoSuchBucket, "The specified bucket does not exist");
    }
    return io_error(err, "stat", dir, errno);
  }
  if (!S_ISDIR(st.st_mode)) {
    return fail(err, ErrorCode::NoSuchBucket, "The specified bucket does not exist");
  }
  return true;
}

bool FsObjectStore::create_bucket(std::string_view bucket, Error* err) {
  if (!valid_bucket_name(bucket)) {
    return fail(err, ErrorCode::InvalidBucketName, "The specified bucket is not valid");
  }
  std::error_code ec;
  fs::create_directories(root_, ec);
  if (ec) return fail(err, ErrorCode::IoFailure, "create root: " + ec.message());

  fs::path dir = root_ / std::string(bucket);
  if (::mkdir(dir.c_str(), 0755) != 0) {
    if (errno == EEXIST) {
      return fail(err, ErrorCode::BucketAlreadyExists, "The requested bucket name is not available");
    }
    return io_error(err, "mkdir", dir, errno);
  }
  logging::storage()->info("created bucket {}", bucket);
  return true;
}

bool FsObjectStore::delete_bucket(std::string_view bucket, Error* err) {
  if (!bucket_exists(bucket, err)) return false;
  fs::path dir = root_ / std::string(bucket);

  std::error_code ec;
  for (fs::recursive_directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    std::error_code sec;
    if (!it->is_regular_file(sec)) continue;
    auto rel = it->path().lexically_relative(dir).generic_string();
    if (has_reserved_segment(rel)) continue;
    return fail(err, ErrorCode::BucketNotEmpty, "The bucket you tried to delete is not empty");
  }
  if (ec) return fail(err, ErrorCode::IoFailure, "scan " + dir.string() + ": " + ec.message());

  fs::remove_all(dir, ec);
  if (ec) return fail(err, ErrorCode::IoFailure, "remove " + dir.string() + ": " + ec.message());

  if (index_) {
    Error ierr;
    if (!index_->delete_bucket(bucket, &ierr)) {
      logging::storage()->warn("index cleanup for bucket {} failed: {}", bucket, ierr.message);
    }
  }
  logging::storage()->info("deleted bucket {}", bucket);
  return true;
}

std::vector<BucketInfo> FsObjectStore::list_buckets(Error* err) {
  std::vector<BucketInfo> out;
  std::error_code ec;
  for (fs::directory_iterator it(root_, ec), end; !ec && it != end; it.increment(ec)) {
    std::string name = it->path().filename().string();
    if (!valid_bucket_name(name)) continue;
    struct stat st {};
    if (::stat(it->path().c_str(), &st) != 0 || !S_ISDIR(st.st_mode)) continue;
    out.push_back(BucketInfo{std::move(name), static_cast<std::int64_t>(st.st_mtim.tv_sec)});
  }
  if (ec) fail(err, ErrorCode::IoFailure, "list " + root_.string() + ": " + ec.message());
  std::sort(out.begin(), out.end(),
            [](const BucketInfo& a, const BucketInfo& b) { return a.name < b.name; });
  return out;
}

bool FsObjectStore::resolve(std::string_view bucket, std::string_view key,
                            fs::path* out, Error* err) const {
  if (!valid_bucket_name(bucket)) {
    return fail(err, ErrorCode::InvalidBucketName, "The specified bucket is not valid");
  }
  if (!valid_key(key)) {
    return fail(err, ErrorCode::InvalidPath, "Invalid object key");
  }
  fs::path bucket_dir = root_ / std::string(bucket);
  fs::path p = (bucket_dir / std::string(key)).lexically_normal();
  auto rel = p.lexically_relative(bucket_dir);
  if (rel.empty() || *rel.begin() == "..") {
    return fail(err, ErrorCode::InvalidPath, "Invalid object key");
  }
  *out = std::move(p);
  return true;
}

bool FsObjectStore::commit_object(std::string_view bucket, std::string_view key,
                                  const BodyWriter& write_body,
                                  std::string_view etag,
                                  std::string_view content_type,
                                  ObjectMeta* out_meta,
                                  Error* err) {
  fs::path final_path;
  if (!resolve(bucket, key, &final_path, err)) return false;
  if (!bucket_exists(bucket, err)) return false;

  fs::path bucket_dir = root_ / std::string(bucket);
  fs::path parent = final_path.parent_path();

  auto make_parents = [&](Error* e) {
    std::error_code ec;
    for (int attempt = 0; attempt < kCommitAttempts; ++attempt) {
      ec.clear();
      fs::create_directories(parent, ec);
      // ENOENT: a concurrent delete removed an ancestor mid-creation.
      if (ec != std::errc::no_such_file_or_directory) break;
    }
    if (ec) {
      if (ec == std::errc::not_a_directory || ec == std::errc::file_exists) {
        return fail(e, ErrorCode::PathConflict, "Object key conflicts with an existing object");
      }
      return fail(e, ErrorCode::IoFailure, "mkdir " + parent.string() + ": " + ec.message());
    }
    return true;
  };
  if (!make_parents(err)) return false;

  std::string suffix = util::random_hex(8);
  if (suffix.empty()) return fail(err, ErrorCode::IoFailure, "random source unavailable");
  fs::path tmp = bucket_dir / (std::string(kReservedPrefix) + "tmp." + suffix);

  auto start = Clock::now();
  FileHandle fd(::open(tmp.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644));
  if (!fd.valid()) return io_error(err, "open", tmp, errno);
  TempFileGuard guard(tmp);

  if (!write_body(fd.get(), err)) {
    observe("write", false, 0, start);
    return false;
  }
  if (::fsync(fd.get()) != 0) {
    observe("write", false, 0, start);
    return io_error(err, "fsync", tmp, errno);
  }
  struct stat st {};
  if (::fstat(fd.get(), &st) != 0) return io_error(err, "fstat", tmp, errno);
  if (!fd.close()) {
    observe("write", false, 0, start);
    return io_error(err, "close", tmp, errno);
  }
  observe("write", true, static_cast<std::size_t>(st.st_size), start);

  start = Clock::now();
  int rc = -1;
  int e = 0;
  for (int attempt = 0; attempt < kCommitAttempts; ++attempt) {
    rc = ::rename(tmp.c_str(), final_path.c_str());
    if (rc == 0) break;
    e = errno;
    if (!is_transient(e) && e != ENOENT) break;
    // A concurrent delete may have pruned the parent directories.
    if (e == ENOENT && !make_parents(err)) {
      observe("rename", false, 0, start);
      return false;
    }
  }
  if (rc != 0) {
    observe("rename", false, 0, start);
    if (e == EISDIR || e == ENOTDIR || e == ENOTEMPTY || e == EEXIST) {
      return fail(err, ErrorCode::PathConflict, "Object key conflicts with an existing prefix");
    }
    return io_error(err, "rename", final_path, e);
  }
  guard.release();
  observe("rename", true, 0, start);

  ObjectRecord rec;
  rec.size = static_cast<std::int64_t>(st.st_size);
  rec.mtime_ns = mtime_ns(st);
  rec.ino = static_cast<std::uint64_t>(st.st_ino);
  rec.etag = std::string(etag);
  rec.content_type = std::string(content_type);
  if (index_) {
    Error ierr;
    if (!index_->put_object(bucket, key, rec, &ierr)) {
      // The object is durable; head_object recomputes the ETag without a record.
      logging::storage()->warn("index update for {}/{} failed: {}", bucket, key, ierr.message);
    }
  }

  if (out_meta) {
    out_meta->etag = rec.etag;
    out_meta->size = rec.size;
    out_meta->mtime = static_cast<std::int64_t>(st.st_mtim.tv_sec);
    out_meta->content_type = content_type.empty() ? content_type_for_key(key) : rec.content_type;
  }
  logging::storage()->debug("stored {}/{} ({} bytes)", bucket, key, rec.size);
  return true;
}

bool FsObjectStore::put_object(std::string_view bucket, std::string_view key,
                               std::string_view data,
                               std::string_view content_type,
                               ObjectMeta* out_meta,
                               Error* err) {
  const std::string etag = "\"" + util::sha256_hex(data) + "\"";
  return commit_object(
      bucket, key,
      [data](int fd, Error* e) { return write_all(fd, data, e); },
      etag, content_type, out_meta, err);
}

bool FsObjectStore::put_object_from_files(std::string_view bucket, std::string_view key,
                                          const std::vector<fs::path>& sources,
                                          std::string_view content_type,
                                          std::string_view etag,
                                          ObjectMeta* out_meta,
                                          Error* err) {
  auto copy_all = [&sources](int out_fd, Error* e) {
    std::string buf(kChunkSize, '\0');
    for (const auto& src : sources) {
      FileHandle in(::open(src.c_str(), O_RDONLY | O_CLOEXEC));
      if (!in.valid()) return io_error(e, "open", src, errno);
      for (;;) {
        ssize_t n = ::read(in.get(), buf.data(), buf.size());
        if (n < 0) {
          if (errno == EINTR) continue;
          return io_error(e, "read", src, errno);
        }
        if (n == 0) break;
        if (!write_all(out_fd, std::string_view(buf.data(), static_cast<std::size_t>(n)), e)) {
          return false;
        }
      }
    }
    return true;
  };
  return commit_object(bucket, key, copy_all, etag, content_type, out_meta, err);
}

bool FsObjectStore::describe(std::string_view bucket, std::string_view key, int fd,
                             ObjectMeta* out_meta, Error* err) {
  struct stat st {};
  if (::fstat(fd, &st) != 0) {
    return fail(err, ErrorCode::IoFailure, std::string("fstat failed: ") + std::strerror(errno));
  }
  ObjectMeta meta;
  meta.size = static_cast<std::int64_t>(st.st_size);
  meta.mtime = static_cast<std::int64_t>(st.st_mtim.tv_sec);

  ObjectRecord rec;
  bool cached = false;
  if (index_) {
    Error ierr;
    if (index_->get_object(bucket, key, &rec, &ierr)) {
      cached = rec.size == meta.size && rec.mtime_ns == mtime_ns(st) &&
               rec.ino == static_cast<std::uint64_t>(st.st_ino);
    } else if (ierr.code != ErrorCode::NoSuchKey) {
      logging::storage()->warn("index lookup for {}/{} failed: {}", bucket, key, ierr.message);
    }
  }

  if (cached) {
    meta.etag = rec.etag;
    meta.content_type = rec.content_type.empty() ? content_type_for_key(key) : rec.content_type;
  } else {
    std::string hex;
    auto start = Clock::now();
    bool ok = hash_fd(fd, &hex, err);
    observe("read", ok, static_cast<std::size_t>(meta.size), start);
    if (!ok) return false;
    meta.etag = "\"" + hex + "\"";
    meta.content_type = content_type_for_key(key);
  }
  if (out_meta) *out_meta = std::move(meta);
  return true;
}

bool FsObjectStore::read_object(std::string_view bucket, std::string_view key,
                                std::uint64_t offset, std::uint64_t length,
                                const ByteSink& sink,
                                ObjectMeta* out_meta,
                                Error* err) {
  fs::path path;
  if (!resolve(bucket, key, &path, err)) return false;
  if (!bucket_exists(bucket, err)) return false;

  FileHandle fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
  if (!fd.valid()) {
    if (errno == ENOENT || errno == ENOTDIR) {
      return fail(err, ErrorCode::NoSuchKey, "The specified key does not exist");
    }
    return io_error(err, "open", path, errno);
  }
  struct stat st {};
  if (::fstat(fd.get(), &st) != 0) return io_error(err, "fstat", path, errno);
  if (!S_ISREG(st.st_mode)) {
    return fail(err, ErrorCode::NoSuchKey, "The specified key does not exist");
  }

  ObjectMeta meta;
  if (!describe(bucket, key, fd.get(), &meta, err)) return false;
  if (out_meta) *out_meta = meta;

  const std::uint64_t size = static_cast<std::uint64_t>(meta.size);
  if (offset >= size) return true;
  std::uint64_t remaining = std::min(length, size - offset);

  auto start = Clock::now();
  std::size_t total = 0;
  std::string buf(static_cast<std::size_t>(std::min<std::uint64_t>(kChunkSize, remaining)), '\0');
  off_t off = static_cast<off_t>(offset);
  while (remaining > 0) {
    std::size_t want = static_cast<std::size_t>(std::min<std::uint64_t>(buf.size(), remaining));
    ssize_t n = ::pread(fd.get(), buf.data(), want, off);
    if (n < 0) {
      if (errno == EINTR) continue;
      observe("read", false, total, start);
      return io_error(err, "read", path, errno);
    }
    if (n == 0) break; // truncated underneath us
    total += static_cast<std::size_t>(n);
    off += n;
    remaining -= static_cast<std::uint64_t>(n);
    if (!sink(std::string_view(buf.data(), static_cast<std::size_t>(n)))) break;
  }
  observe("read", true, total, start);
  return true;
}

bool FsObjectStore::get_object(std::string_view bucket, std::string_view key,
                               std::string* out_data,
                               ObjectMeta* out_meta,
                               Error* err) {
  std::string data;
  bool ok = read_object(
      bucket, key, 0, UINT64_MAX,
      [&data](std::string_view chunk) {
        data.append(chunk.data(), chunk.size());
        return true;
      },
      out_meta, err);
  if (ok && out_data) *out_data = std::move(data);
  return ok;
}

bool FsObjectStore::head_object(std::string_view bucket, std::string_view key,
                                ObjectMeta* out_meta,
                                Error* err) {
  return read_object(
      bucket, key, 0, 0, [](std::string_view) { return true; }, out_meta, err);
}

void FsObjectStore::prune_empty_dirs(const fs::path& bucket_dir, fs::path dir) {
  while (dir != bucket_dir && dir.has_parent_path()) {
    // rmdir only succeeds on an empty directory.
    if (::rmdir(dir.c_str()) != 0) break;
    dir = dir.parent_path();
  }
}

bool FsObjectStore::delete_object(std::string_view bucket, std::string_view key,
                                  Error* err) {
  fs::path path;
  if (!resolve(bucket, key, &path, err)) return false;
  if (!bucket_exists(bucket, err)) return false;

  auto start = Clock::now();
  if (::unlink(path.c_str()) != 0) {
    int e = errno;
    observe("delete", e == ENOENT || e == ENOTDIR || e == EISDIR, 0, start);
    if (e == ENOENT || e == ENOTDIR || e == EISDIR || e == EPERM) {
      return fail(err, ErrorCode::NoSuchKey, "The specified key does not exist");
    }
    return io_error(err, "unlink", path, e);
  }
  observe("delete", true, 0, start);

  if (index_) {
    Error ierr;
    if (!index_->delete_object(bucket, key, &ierr)) {
      logging::storage()->warn("index delete for {}/{} failed: {}", bucket, key, ierr.message);
    }
  }
  prune_empty_dirs(root_ / std::string(bucket), path.parent_path());
  logging::storage()->debug("deleted {}/{}", bucket, key);
  return true;
}

ListResult FsObjectStore::list_objects(std::string_view bucket,
                                       std::string_view prefix,
                                       std::string_view delimiter,
                                       std::string_view marker,
                                       std::int64_t max_keys,
                                       Error* err) {
  ListResult out;
  if (!bucket_exists(bucket, err)) return out;
  if (max_keys <= 0 || max_keys > 1000) max_keys = 1000;

  const fs::path bucket_dir = root_ / std::string(bucket);
  auto start = Clock::now();

  std::vector<std::string> keys;
  std::error_code ec;
  for (fs::recursive_directory_iterator it(bucket_dir, fs::directory_options::skip_permission_denied, ec), end;
       !ec && it != end; it.increment(ec)) {
    std::string name = it->path().filename().string();
    std::error_code sec;
    if (is_reserved_segment(name)) {
      if (it->is_directory(sec)) it.disable_recursion_pending();
      continue;
    }
    if (!it->is_regular_file(sec)) continue;
    std::string key = it->path().lexically_relative(bucket_dir).generic_string();
    if (starts_with(key, prefix)) keys.push_back(std::move(key));
  }
  if (ec) {
    observe("list", false, 0, start);
    fail(err, ErrorCode::IoFailure, "list " + bucket_dir.string() + ": " + ec.message());
    return out;
  }
  std::sort(keys.begin(), keys.end());

  std::int64_t count = 0;
  for (const auto& key : keys) {
    if (!delimiter.empty()) {
      size_t pos = key.find(delimiter, prefix.size());
      if (pos != std::string::npos) {
        std::string cp = key.substr(0, pos + delimiter.size());
        if (!marker.empty() && cp <= marker) continue;
        if (!out.common_prefixes.empty() && out.common_prefixes.back() == cp) continue;
        if (count == max_keys) {
          out.is_truncated = true;
          break;
        }
        out.common_prefixes.push_back(cp);
        out.next_marker = std::move(cp);
        ++count;
        continue;
      }
    }
    if (!marker.empty() && key <= marker) continue;
    if (count == max_keys) {
      out.is_truncated = true;
      break;
    }

    fs::path path = bucket_dir / key;
    FileHandle fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
    if (!fd.valid()) continue; // deleted since the scan
    ListedObject obj;
    obj.key = key;
    Error derr;
    if (!describe(bucket, key, fd.get(), &obj.meta, &derr)) {
      logging::storage()->warn("skipping {}/{} in listing: {}", bucket, key, derr.message);
      continue;
    }
    out.next_marker = key;
    out.objects.push_back(std::move(obj));
    ++count;
  }
  if (!out.is_truncated) out.next_marker.clear();
  observe("list", true, 0, start);
  return out;
}

} // namespace storage
