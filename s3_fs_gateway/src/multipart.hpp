#pragma once

#include "errors.hpp"
#include "meta_index.hpp"
#include "storage.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace multipart {

constexpr std::uint32_t kMinPartNumber = 1;
constexpr std::uint32_t kMaxPartNumber = 10000;

struct DeclaredPart {
  std::uint32_t part_number = 0;
  std::string etag;
};

// Staged multipart uploads. Parts live under
// <root>/.s3fs/multipart/<upload_id>/ and upload/part records in the index.
// Operations on one upload id are serialized; distinct uploads never contend.
class Coordinator {
public:
  Coordinator(storage::FsObjectStore* store,
              storage::MetaIndex* index,
              std::int64_t expiry_seconds);

  bool initiate(std::string_view bucket, std::string_view key,
                std::string_view content_type,
                std::string* upload_id,
                storage::Error* err);

  bool upload_part(std::string_view bucket, std::string_view key,
                   std::string_view upload_id,
                   std::uint32_t part_number,
                   std::string_view data,
                   std::string* etag,
                   storage::Error* err);

  // Parts must be declared with strictly increasing part numbers and the
  // ETags returned by upload_part.
  bool complete(std::string_view bucket, std::string_view key,
                std::string_view upload_id,
                const std::vector<DeclaredPart>& parts,
                storage::ObjectMeta* out_meta,
                storage::Error* err);

  // Succeeds when the upload is already gone.
  bool abort(std::string_view bucket, std::string_view key,
             std::string_view upload_id,
             storage::Error* err);

  // Reclaims uploads created more than expiry_seconds before `now`, plus
  // staging directories left without a record. Returns uploads reclaimed.
  std::size_t sweep(std::int64_t now);

  void set_expiry(std::int64_t seconds) { expiry_seconds_.store(seconds); }
  std::int64_t expiry() const { return expiry_seconds_.load(); }

  std::filesystem::path staging_dir(std::string_view upload_id) const;

private:
  struct UploadLock {
    std::mutex mu;
    std::atomic<bool> finished{false};
  };

  std::shared_ptr<UploadLock> acquire(std::string_view upload_id);
  void release(std::string_view upload_id, const std::shared_ptr<UploadLock>& lock);

  bool load_upload(std::string_view bucket, std::string_view key,
                   std::string_view upload_id,
                   storage::UploadRecord* out,
                   bool* missing,
                   storage::Error* err);
  // Validates the declared parts and writes the final object. Caller holds the upload lock.
  bool assemble(const storage::UploadRecord& rec,
                const std::vector<DeclaredPart>& parts,
                storage::ObjectMeta* out_meta,
                storage::Error* err);
  void destroy(std::string_view upload_id);

  storage::FsObjectStore* store_;
  storage::MetaIndex* index_;
  std::atomic<std::int64_t> expiry_seconds_;
  std::filesystem::path staging_root_;

  std::mutex locks_mu_;
  std::unordered_map<std::string, std::shared_ptr<UploadLock>> locks_;
};

// Multipart ETag: hex SHA-256 over the raw digests of the part ETags, with
// a "-<count>" suffix, quoted. Empty when a part ETag is not hex.
std::string multipart_etag(const std::vector<std::string>& part_etags);

} // namespace multipart
