#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/object_store.hpp"

namespace streamlift::storage {

/*
  Builds the object store from configuration.

  Called again after a credential refresh so new jobs pick up fresh keys:

      auto store = StorageFactory::Build(config.storage(), creds);
*/

class StorageFactory {
 public:
  static ObjectStorePtr Build(const streamlift::runtime::config::StorageConfig& cfg, const common::S3Credentials& credentials);
};

} // namespace streamlift::storage
