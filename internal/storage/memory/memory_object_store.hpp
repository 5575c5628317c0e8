#pragma once

#include <map>
#include <optional>
#include <shared_mutex>
#include <string>

#include "internal/storage/object_store.hpp"

namespace streamlift::storage {

/*
  In-process object store.

  Thread safety:
    - shared reads
    - exclusive writes
*/

class MemoryObjectStore final : public ObjectStore {
 public:
  struct StoredObject {
    std::shared_ptr<arrow::Buffer> body;
    PutOptions                     options;
  };

  MemoryObjectStore()           = default;
  ~MemoryObjectStore() override = default;

  void Put(const std::string& key, const std::shared_ptr<arrow::Buffer>& body, const PutOptions& options) override;

  std::vector<std::string> List(const std::string& prefix) override;

  bool Head(const std::string& key) override;

  // Test helpers
  std::optional<StoredObject> Get(const std::string& key) const;
  std::string                 GetString(const std::string& key) const;
  size_t                      PutCount() const;

 private:
  mutable std::shared_mutex           mutex_;
  std::map<std::string, StoredObject> objects_;
  size_t                              put_count_ = 0;
};

} // namespace streamlift::storage
