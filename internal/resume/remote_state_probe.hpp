#pragma once

#include <set>
#include <string>

#include "internal/model/transfer_job.hpp"
#include "internal/storage/common/key_layout.hpp"
#include "internal/storage/object_store.hpp"

namespace streamlift::resume {

// Segment filenames confirmed present remotely before this run.
using ResumeSet = std::set<std::string>;

/*
  Discovers what a previous run already left in remote storage.

  A failed listing is treated as "nothing there": re-sending is always
  safe, failing the job on an uncertain probe is not.
*/
class RemoteStateProbe {
 public:
  RemoteStateProbe(storage::ObjectStorePtr store, storage::common::KeyLayout layout);

  ResumeSet ExistingSegments(const model::TransferJob& job) const;

  // True only when both the template and the finalized manifest exist.
  bool ManifestArtifactsExist(const model::TransferJob& job) const;

 private:
  storage::ObjectStorePtr    store_;
  storage::common::KeyLayout layout_;
};

} // namespace streamlift::resume
