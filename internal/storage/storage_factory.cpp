#include "storage_factory.hpp"

#include "memory/memory_object_store.hpp"
#include "object/arrow_object_store.hpp"

namespace streamlift::storage {

ObjectStorePtr StorageFactory::Build(const streamlift::runtime::config::StorageConfig& cfg, const common::S3Credentials& credentials) {
  if (cfg.filesystem() == streamlift::runtime::config::FILE_SYSTEM_MEMORY) {
    return std::make_shared<MemoryObjectStore>();
  }

  if (cfg.root_path().empty()) {
    throw std::invalid_argument("storage.root_path is required");
  }

  auto [object_fs, object_root] = common::Unwrap(common::ResolveFileSystem(cfg, credentials));
  return std::make_shared<ArrowObjectStore>(std::move(object_fs), std::move(object_root));
}

} // namespace streamlift::storage
