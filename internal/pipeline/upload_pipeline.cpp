#include "upload_pipeline.hpp"

#include <chrono>
#include <filesystem>

#include "internal/manifest/manifest_builder.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/progress/progress_reporter.hpp"
#include "internal/resume/remote_state_probe.hpp"
#include "internal/transcode/codec_plan.hpp"
#include "internal/util/errors.hpp"

namespace streamlift::pipeline {

namespace fs = std::filesystem;

using streamlift::observability::BoolField;
using streamlift::observability::DoubleField;
using streamlift::observability::IntField;
using streamlift::observability::StringField;

streamlift::v1::ConversionRecord BuildConversionRecord(const std::vector<std::string>& segment_files, const std::string& output_dir,
                                                       double segment_duration_seconds, double total_duration_seconds) {
  streamlift::v1::ConversionRecord record;
  record.set_output_dir(output_dir);
  record.set_total_count(static_cast<uint32_t>(segment_files.size()));
  record.set_duration_seconds(total_duration_seconds);
  *record.mutable_converted_at() = util::ToProto(util::Now());

  for (size_t i = 0; i < segment_files.size(); ++i) {
    auto* entry = record.add_segments();
    entry->set_filename(segment_files[i]);
    entry->set_index(static_cast<uint32_t>(i));
    entry->set_duration_seconds(segment_duration_seconds);
  }

  if (!segment_files.empty() && total_duration_seconds > 0.0) {
    const double remainder = total_duration_seconds - segment_duration_seconds * static_cast<double>(segment_files.size() - 1);
    if (remainder > 0.0 && remainder < segment_duration_seconds) {
      record.mutable_segments(record.segments_size() - 1)->set_duration_seconds(remainder);
    }
  }
  return record;
}

UploadPipeline::UploadPipeline(PipelineDependencies deps, PipelineSettings settings) : deps_(std::move(deps)), settings_(settings) {
  if (!deps_.credentials || !deps_.store_for || !deps_.transcoder || !deps_.cache || !deps_.finalizer || !deps_.status) {
    throw std::invalid_argument("upload pipeline is missing a dependency");
  }
}

model::UploadSession::Snapshot UploadPipeline::Run(model::TransferJob job, const util::CancellationToken& cancel) {
  // Status pushes are tenant scoped, so the tenant is fixed before anything can fail.
  if (job.tenant.empty()) job.tenant = deps_.credentials->Current().identity_id;

  std::error_code ec;
  const auto      source_size = fs::file_size(job.source_path, ec);

  model::UploadSession       session(job.job_id, ec ? 0 : source_size);
  progress::ProgressReporter reporter(deps_.status, job, settings_.status_interval);

  observability::TraceSpan span("UploadPipeline.Run", job.job_id);
  span.Tag("streamlift.tenant", job.tenant);
  span.Tag("streamlift.media_kind", model::ToString(job.kind));
  const auto started_at = std::chrono::steady_clock::now();
  const auto elapsed_ms = [&] {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
  };

  try {
    Execute(job, session, reporter, cancel);
  } catch (const std::exception& e) {
    if (!model::IsTerminal(session.Status())) {
      session.Transition(model::UploadStatus::kFailed);
    }
    span.Fail(e.what());
    STREAMLIFT_LOG_ERROR("Upload failed", {StringField("job_id", job.job_id), StringField("error", e.what())});
    reporter.Milestone(model::UploadStatus::kFailed, session.ProgressPercent(), e.what());

    const auto failed = session.Read();
    observability::Metrics::Instance().AddSegments("transferred", failed.transferred_this_run);
    observability::Metrics::Instance().RecordJob(dynamic_cast<const util::Cancelled*>(&e) ? "cancelled" : "failed", elapsed_ms());
    throw;
  }

  CleanupStaging(job.job_id);

  auto snapshot = session.Read();
  span.Tag("streamlift.segments.total", static_cast<std::int64_t>(snapshot.total_segments));
  span.Tag("streamlift.segments.skipped", static_cast<std::int64_t>(snapshot.skipped_segments));
  observability::Metrics::Instance().AddSegments("transferred", snapshot.transferred_this_run);
  observability::Metrics::Instance().AddSegments("skipped", snapshot.skipped_segments);
  observability::Metrics::Instance().RecordJob("completed", elapsed_ms());
  return snapshot;
}

void UploadPipeline::Execute(const model::TransferJob& job, model::UploadSession& session, progress::ProgressReporter& reporter,
                             const util::CancellationToken& cancel) {
  std::error_code ec;
  if (!fs::is_regular_file(job.source_path, ec)) {
    throw util::InputError("source file not found: " + job.source_path);
  }
  if (!transcode::IsSupportedSource(job.source_path)) {
    throw util::InputError("unsupported source format: " + job.source_path);
  }

  auto credentials = auth::EnsureFresh(*deps_.credentials, settings_.refresh_margin);
  auto store       = deps_.store_for(credentials);

  auto record = Convert(job, session, reporter, cancel);

  cancel.ThrowIfCancelled("resume probe");
  resume::RemoteStateProbe probe(store, deps_.layout);

  transfer::TransferRequest request;
  request.job                      = job;
  request.record                   = std::move(record);
  request.subtitle_dir             = deps_.cache->SubtitleDir(job.job_id);
  request.resume                   = probe.ExistingSegments(job);
  request.manifest_artifacts_exist = probe.ManifestArtifactsExist(job);

  auto manifest = std::make_shared<manifest::ManifestBuilder>(store, deps_.layout, deps_.finalizer);
  transfer::TransferOrchestrator orchestrator(store, deps_.layout, manifest, settings_.transfer);
  orchestrator.Run(request, session, reporter, cancel);

  session.Transition(model::UploadStatus::kCompleted);
  reporter.Milestone(model::UploadStatus::kCompleted, 100.0, "Upload complete");

  auto snapshot = session.Read();
  STREAMLIFT_LOG_INFO("Upload completed", {StringField("job_id", job.job_id), IntField("total_segments", snapshot.total_segments),
                                           IntField("skipped_segments", snapshot.skipped_segments),
                                           IntField("transferred_this_run", snapshot.transferred_this_run)});
}

streamlift::v1::ConversionRecord UploadPipeline::Convert(const model::TransferJob& job, model::UploadSession& session,
                                                         progress::ProgressReporter& reporter, const util::CancellationToken& cancel) {
  if (auto existing = deps_.cache->TryReuse(job.job_id)) {
    session.Transition(model::UploadStatus::kUsingExistingConversion);
    reporter.Milestone(model::UploadStatus::kUsingExistingConversion, 0.0, "Using existing conversion");
    return *existing;
  }

  session.Transition(model::UploadStatus::kConverting);
  reporter.Milestone(model::UploadStatus::kConverting, 0.0, "Converting for streaming");

  auto info = deps_.transcoder->Probe(job.source_path, cancel);
  auto plan = transcode::PlanCodecs(info, static_cast<uint32_t>(settings_.transfer.segment_duration_seconds));

  STREAMLIFT_LOG_INFO("Source probed", {StringField("job_id", job.job_id), StringField("video_codec", info.video_codec),
                                        StringField("audio_codec", info.audio_codec), IntField("width", info.width), IntField("height", info.height),
                                        DoubleField("duration_seconds", info.duration_seconds), BoolField("copy_video", plan.copy_video),
                                        BoolField("copy_audio", plan.copy_audio)});

  const auto segment_dir = deps_.cache->SegmentDir(job.job_id);
  auto       result      = deps_.transcoder->Transcode(
      job.source_path, segment_dir, plan,
      [&](const transcode::TranscodeProgress& progress) { reporter.OnTranscodeProgress(progress, info.duration_seconds); }, cancel);

  const double duration = info.duration_seconds > 0.0 ? info.duration_seconds : result.duration_seconds;
  auto record = BuildConversionRecord(result.segment_files, segment_dir, settings_.transfer.segment_duration_seconds, duration);

  if (deps_.subtitles) {
    auto entries = deps_.subtitles->Resolve(job.job_id, job.source_path, info, deps_.cache->SubtitleDir(job.job_id), cancel);
    for (auto& entry : entries) *record.add_subtitles() = std::move(entry);
    record.set_has_subtitles(record.subtitles_size() > 0);
  }

  deps_.cache->Persist(job.job_id, record);
  return record;
}

void UploadPipeline::CleanupStaging(const std::string& job_id) {
  if (settings_.keep_staging) return;
  try {
    deps_.cache->Discard(job_id);
  } catch (const std::exception& e) {
    STREAMLIFT_LOG_WARN("Staging cleanup failed", {StringField("job_id", job_id), StringField("error", e.what())});
  }
}

} // namespace streamlift::pipeline
