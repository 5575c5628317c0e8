#pragma once

#include <arrow/buffer.h>
#include <arrow/filesystem/filesystem.h>
#include <arrow/io/file.h>
#include <arrow/result.h>

#include <memory>
#include <string>
#include <utility>

#include "config/config.pb.h"
#include "internal/util/errors.hpp"

namespace streamlift::storage::common {

/*
  Helper: unwrap Arrow Result<T> or throw.

  Errors naming an expired or invalid token become util::CredentialExpired,
  everything else util::TransientIoError.
*/
[[noreturn]] void ThrowArrowError(const arrow::Status& status);

template <typename T>
T Unwrap(const arrow::Result<T>& result) {
  if (!result.ok()) ThrowArrowError(result.status());
  return *result;
}

inline void Unwrap(const arrow::Status& status) {
  if (!status.ok()) ThrowArrowError(status);
}

/*
  Read entire file into buffer
*/
inline std::shared_ptr<arrow::Buffer> ReadAll(std::shared_ptr<arrow::io::RandomAccessFile> file) {
  auto size = Unwrap(file->GetSize());
  return Unwrap(file->Read(size));
}

std::shared_ptr<arrow::Buffer> ReadLocalFile(const std::string& path);

struct S3Credentials {
  std::string access_key;
  std::string secret_key;
  std::string session_token;
};

arrow::Result<std::pair<std::shared_ptr<arrow::fs::FileSystem>, std::string>> ResolveFileSystem(
    const streamlift::runtime::config::StorageConfig& storage_config, const S3Credentials& credentials);

} // namespace streamlift::storage::common
