#pragma once

#include <string>
#include <utility>

namespace storage {

enum class ErrorCode {
  None,
  NoSuchBucket,
  NoSuchKey,
  BucketAlreadyExists,
  BucketNotEmpty,
  InvalidBucketName,
  InvalidPath,       // key would escape the bucket or uses a reserved name
  PathConflict,      // key collides with an existing object/prefix on disk
  InvalidArgument,
  IoFailure,
  NoSuchUpload,
  InvalidPart,
  InvalidPartOrder
};

struct Error {
  ErrorCode code = ErrorCode::None;
  std::string message;
};

// Fill `err` (if non-null) and return false, for `return fail(err, ...)`.
inline bool fail(Error* err, ErrorCode code, std::string message) {
  if (err) {
    err->code = code;
    err->message = std::move(message);
  }
  return false;
}

inline const char* to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::None: return "None";
    case ErrorCode::NoSuchBucket: return "NoSuchBucket";
    case ErrorCode::NoSuchKey: return "NoSuchKey";
    case ErrorCode::BucketAlreadyExists: return "BucketAlreadyExists";
    case ErrorCode::BucketNotEmpty: return "BucketNotEmpty";
    case ErrorCode::InvalidBucketName: return "InvalidBucketName";
    case ErrorCode::InvalidPath: return "InvalidPath";
    case ErrorCode::PathConflict: return "PathConflict";
    case ErrorCode::InvalidArgument: return "InvalidArgument";
    case ErrorCode::IoFailure: return "IoFailure";
    case ErrorCode::NoSuchUpload: return "NoSuchUpload";
    case ErrorCode::InvalidPart: return "InvalidPart";
    case ErrorCode::InvalidPartOrder: return "InvalidPartOrder";
  }
  return "Unknown";
}

} // namespace storage
