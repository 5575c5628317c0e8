#pragma once

#include <arrow/buffer.h>

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace streamlift::storage {

/*
  Remote object storage abstraction.

  Keys are hierarchical, '/'-separated and relative to the store root.
  Writes are whole-object and idempotent per key: segment content is
  deterministic per ordinal, so re-putting a key is always safe.

  Implementations:
    ArrowObjectStore   → Arrow S3 / local filesystem
    MemoryObjectStore  → in-process map (tests, dry runs)
*/

struct PutOptions {
  std::string content_type;
  std::string cache_control;
  // User metadata (job-id, segment-index, ...).
  std::map<std::string, std::string> metadata;
};

class ObjectStore {
 public:
  virtual ~ObjectStore() = default;

  // ------------------------------------------------------------------
  // Put
  // ------------------------------------------------------------------
  /*
    Upload one object. Throws util::TransientIoError on failure,
    util::CredentialExpired when the remote rejects the credentials.
  */
  virtual void Put(const std::string& key, const std::shared_ptr<arrow::Buffer>& body, const PutOptions& options) = 0;

  // ------------------------------------------------------------------
  // List
  // ------------------------------------------------------------------
  /*
    All keys under prefix, recursively. A prefix with no objects is an
    empty result, not an error.
  */
  virtual std::vector<std::string> List(const std::string& prefix) = 0;

  // ------------------------------------------------------------------
  // Head
  // ------------------------------------------------------------------
  virtual bool Head(const std::string& key) = 0;
};

using ObjectStorePtr = std::shared_ptr<ObjectStore>;

} // namespace streamlift::storage
