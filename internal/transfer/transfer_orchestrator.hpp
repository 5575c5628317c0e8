#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "internal/manifest/manifest_builder.hpp"
#include "internal/model/transfer_job.hpp"
#include "internal/model/upload_session.hpp"
#include "internal/progress/progress_reporter.hpp"
#include "internal/resume/remote_state_probe.hpp"
#include "internal/storage/common/key_layout.hpp"
#include "internal/storage/object_store.hpp"
#include "internal/util/cancellation.hpp"
#include "streamlift/v1/conversion.pb.h"

namespace streamlift::transfer {

struct TransferSettings {
  // Segments per bulk batch (C).
  uint32_t concurrent_uploads = 3;
  // Segments sent ahead of the rest (P).
  uint32_t priority_segments = 5;
  double   segment_duration_seconds = 10.0;
};

struct TransferRequest {
  model::TransferJob               job;
  streamlift::v1::ConversionRecord record;
  // Directory holding the .vtt files listed in record.subtitles.
  std::string       subtitle_dir;
  resume::ResumeSet resume;
  bool              manifest_artifacts_exist = false;
};

/*
  Sends a job's segments and keeps the remote manifest current.

  Phase 1: the first min(P, total) segments, all at once. The template is
  then published for exactly that prefix when anything was sent or the
  remote manifest is missing, and the session becomes ready_for_playback.

  Phase 2: the remaining segments in batches of C with a barrier between
  batches. After a batch the manifest is republished when the batch sent
  anything or the covered prefix crossed an unreported milestone (50%,
  100%). The last republish always carries is_complete.

  Resume-set members are never re-sent but are always listed. Any segment
  failure fails the batch and propagates; the session is left for the
  caller to mark failed.
*/
class TransferOrchestrator {
 public:
  TransferOrchestrator(storage::ObjectStorePtr store, storage::common::KeyLayout layout, std::shared_ptr<manifest::ManifestBuilder> manifest,
                       TransferSettings settings);

  void Run(const TransferRequest& request, model::UploadSession& session, progress::ProgressReporter& reporter,
           const util::CancellationToken& cancel);

 private:
  // Returns true when the segment was sent, false when it was resumed.
  bool TransferSegment(const TransferRequest& request, int index, model::UploadSession& session, progress::ProgressReporter& reporter,
                       const util::CancellationToken& cancel);

  // Sends segments [begin, end) concurrently; returns the number freshly sent.
  uint32_t RunBatch(const TransferRequest& request, uint32_t begin, uint32_t end, model::UploadSession& session,
                    progress::ProgressReporter& reporter, const util::CancellationToken& cancel);

  void Publish(const TransferRequest& request, uint32_t covered, uint32_t total);

  // Best-effort; failures are logged.
  void UploadSubtitles(const TransferRequest& request, const util::CancellationToken& cancel);

  storage::ObjectStorePtr                   store_;
  storage::common::KeyLayout                layout_;
  std::shared_ptr<manifest::ManifestBuilder> manifest_;
  TransferSettings                          settings_;
};

} // namespace streamlift::transfer
