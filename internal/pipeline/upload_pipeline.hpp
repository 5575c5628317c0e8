#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include "internal/api/media_api.hpp"
#include "internal/auth/credential_provider.hpp"
#include "internal/conversion/conversion_cache.hpp"
#include "internal/model/transfer_job.hpp"
#include "internal/model/upload_session.hpp"
#include "internal/storage/common/key_layout.hpp"
#include "internal/storage/object_store.hpp"
#include "internal/subtitles/subtitle_resolver.hpp"
#include "internal/transcode/transcoder.hpp"
#include "internal/transfer/transfer_orchestrator.hpp"
#include "internal/util/cancellation.hpp"

namespace streamlift::pipeline {

// Object store bound to a set of credentials.
using ObjectStoreProvider = std::function<storage::ObjectStorePtr(const auth::Credentials&)>;

struct PipelineDependencies {
  std::shared_ptr<auth::CredentialProvider>     credentials;
  ObjectStoreProvider                           store_for;
  storage::common::KeyLayout                    layout{"", ""};
  transcode::TranscoderPtr                      transcoder;
  std::shared_ptr<conversion::ConversionCache>  cache;
  // Null disables subtitle resolution.
  std::shared_ptr<subtitles::SubtitleResolver>  subtitles;
  api::ManifestFinalizerPtr                     finalizer;
  api::StatusSinkPtr                            status;
};

struct PipelineSettings {
  transfer::TransferSettings transfer;
  std::chrono::milliseconds  status_interval{15000};
  std::chrono::milliseconds  refresh_margin{300000};
  bool                       keep_staging = false;
};

/*
  One job end to end:

    validate source → refresh credentials → reuse or transcode →
    subtitles (fresh transcodes only) → resume probe → transfer →
    completed → staging cleanup

  Any failure marks the session failed, pushes a failed status and
  rethrows. The staging directory is kept on failure so a redelivered
  message can reuse the conversion.
*/
class UploadPipeline {
 public:
  UploadPipeline(PipelineDependencies deps, PipelineSettings settings);

  // Returns the final session state.
  model::UploadSession::Snapshot Run(model::TransferJob job, const util::CancellationToken& cancel);

 private:
  streamlift::v1::ConversionRecord Convert(const model::TransferJob& job, model::UploadSession& session,
                                           progress::ProgressReporter& reporter, const util::CancellationToken& cancel);

  void Execute(const model::TransferJob& job, model::UploadSession& session, progress::ProgressReporter& reporter,
               const util::CancellationToken& cancel);

  void CleanupStaging(const std::string& job_id);

  PipelineDependencies deps_;
  PipelineSettings     settings_;
};

/*
  Segment entries for files in ordinal order. Every entry gets the nominal
  duration except the last, which gets what remains of total_duration_seconds
  when that is known and shorter.
*/
streamlift::v1::ConversionRecord BuildConversionRecord(const std::vector<std::string>& segment_files, const std::string& output_dir,
                                                       double segment_duration_seconds, double total_duration_seconds);

} // namespace streamlift::pipeline
