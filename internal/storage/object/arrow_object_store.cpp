#include "arrow_object_store.hpp"

#include <arrow/filesystem/path_util.h>
#include <arrow/io/interfaces.h>
#include <arrow/result.h>
#include <arrow/util/key_value_metadata.h>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/key_layout.hpp"

namespace streamlift::storage {

using namespace streamlift::storage::common;

ArrowObjectStore::ArrowObjectStore(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root_path)
    : fs_(std::move(fs)), root_path_(std::move(root_path)) {
  while (!root_path_.empty() && root_path_.back() == '/') root_path_.pop_back();
}

std::string ArrowObjectStore::ObjectPath(const std::string& key) const {
  if (key.empty() || key.front() == '/') {
    throw std::invalid_argument("object key must be relative and non-empty");
  }
  return JoinKey(root_path_, key);
}

std::string ArrowObjectStore::KeyFromPath(const std::string& path) const {
  if (root_path_.empty()) return path;
  if (path.size() > root_path_.size() && path.compare(0, root_path_.size(), root_path_) == 0 && path[root_path_.size()] == '/') {
    return path.substr(root_path_.size() + 1);
  }
  return path;
}

/*
  Upload buffer as object.

  Local filesystems need the parent directory. S3 would materialize
  directory marker objects, so it is skipped there.
*/
void ArrowObjectStore::Put(const std::string& key, const std::shared_ptr<arrow::Buffer>& body, const PutOptions& options) {
  const auto path   = ObjectPath(key);
  const auto parent = arrow::fs::internal::GetAbstractPathParent(path).first;
  if (!parent.empty() && fs_->type_name() == "local") {
    Unwrap(fs_->CreateDir(parent, /*recursive=*/true));
  }

  auto metadata = std::make_shared<arrow::KeyValueMetadata>();
  if (!options.content_type.empty()) metadata->Append("Content-Type", options.content_type);
  if (!options.cache_control.empty()) metadata->Append("Cache-Control", options.cache_control);
  for (const auto& [name, value] : options.metadata) {
    metadata->Append("x-amz-meta-" + name, value);
  }

  auto out      = Unwrap(fs_->OpenOutputStream(path, metadata));
  Unwrap(out->Write(body->data(), body->size()));
  Unwrap(out->Close());
}

std::vector<std::string> ArrowObjectStore::List(const std::string& prefix) {
  auto base_dir = ObjectPath(prefix);
  while (!base_dir.empty() && base_dir.back() == '/') base_dir.pop_back();

  arrow::fs::FileSelector selector;
  selector.base_dir        = base_dir;
  selector.recursive       = true;
  selector.allow_not_found = true;

  auto infos = Unwrap(fs_->GetFileInfo(selector));

  std::vector<std::string> keys;
  keys.reserve(infos.size());
  for (const auto& info : infos) {
    if (info.type() != arrow::fs::FileType::File) continue;
    keys.push_back(KeyFromPath(info.path()));
  }
  return keys;
}

bool ArrowObjectStore::Head(const std::string& key) {
  auto info = Unwrap(fs_->GetFileInfo(ObjectPath(key)));
  return info.type() == arrow::fs::FileType::File;
}

} // namespace streamlift::storage
