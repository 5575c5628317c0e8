#pragma once

#include <memory>
#include <string>

#include <arrow/buffer.h>
#include <arrow/filesystem/filesystem.h>

#include "internal/storage/object_store.hpp"

namespace streamlift::storage {

/*
  Object storage (S3 / MinIO / local directory) using Arrow filesystem.

  Characteristics:
    - immutable whole-object writes
    - Content-Type / Cache-Control carried as stream metadata
    - listing of a missing prefix is empty
*/

class ArrowObjectStore final : public ObjectStore {
 public:
  ArrowObjectStore(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root_path);

  void Put(const std::string& key, const std::shared_ptr<arrow::Buffer>& body, const PutOptions& options) override;

  std::vector<std::string> List(const std::string& prefix) override;

  bool Head(const std::string& key) override;

 private:
  std::string ObjectPath(const std::string& key) const;
  std::string KeyFromPath(const std::string& path) const;

  std::shared_ptr<arrow::fs::FileSystem> fs_;
  std::string                            root_path_;
};

} // namespace streamlift::storage
