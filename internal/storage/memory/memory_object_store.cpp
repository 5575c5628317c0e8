#include "memory_object_store.hpp"

#include <mutex>

namespace streamlift::storage {

void MemoryObjectStore::Put(const std::string& key, const std::shared_ptr<arrow::Buffer>& body, const PutOptions& options) {
  std::unique_lock lock(mutex_);
  objects_[key] = StoredObject{body, options};
  ++put_count_;
}

std::vector<std::string> MemoryObjectStore::List(const std::string& prefix) {
  std::shared_lock         lock(mutex_);
  std::vector<std::string> keys;
  for (auto it = objects_.lower_bound(prefix); it != objects_.end(); ++it) {
    if (it->first.compare(0, prefix.size(), prefix) != 0) break;
    keys.push_back(it->first);
  }
  return keys;
}

bool MemoryObjectStore::Head(const std::string& key) {
  std::shared_lock lock(mutex_);
  return objects_.count(key) > 0;
}

std::optional<MemoryObjectStore::StoredObject> MemoryObjectStore::Get(const std::string& key) const {
  std::shared_lock lock(mutex_);
  auto             it = objects_.find(key);
  if (it == objects_.end()) return std::nullopt;
  return it->second;
}

std::string MemoryObjectStore::GetString(const std::string& key) const {
  auto object = Get(key);
  if (!object || !object->body) return {};
  return object->body->ToString();
}

size_t MemoryObjectStore::PutCount() const {
  std::shared_lock lock(mutex_);
  return put_count_;
}

} // namespace streamlift::storage
