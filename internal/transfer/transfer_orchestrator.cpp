#include "transfer_orchestrator.hpp"

#include <algorithm>
#include <array>
#include <atomic>
#include <cstdio>
#include <filesystem>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/task_group.hpp"

namespace streamlift::transfer {

namespace fs = std::filesystem;

using streamlift::observability::IntField;
using streamlift::observability::StringField;

namespace {

constexpr const char* kSegmentContentType  = "video/mp2t";
constexpr const char* kSegmentCacheControl = "public, max-age=31536000";
constexpr const char* kSubtitleContentType = "text/vtt";

constexpr std::array<double, 2> kMilestones = {0.5, 1.0};

// Number of milestones reached by covered / total.
size_t MilestonesReached(uint32_t covered, uint32_t total) {
  size_t reached = 0;
  for (double fraction : kMilestones) {
    if (static_cast<double>(covered) >= fraction * total) ++reached;
  }
  return reached;
}

} // namespace

TransferOrchestrator::TransferOrchestrator(storage::ObjectStorePtr store, storage::common::KeyLayout layout,
                                           std::shared_ptr<manifest::ManifestBuilder> manifest, TransferSettings settings)
    : store_(std::move(store)), layout_(std::move(layout)), manifest_(std::move(manifest)), settings_(settings) {
  if (settings_.concurrent_uploads == 0) {
    throw std::invalid_argument("concurrent_uploads must be positive");
  }
}

bool TransferOrchestrator::TransferSegment(const TransferRequest& request, int index, model::UploadSession& session,
                                           progress::ProgressReporter& reporter, const util::CancellationToken& cancel) {
  const auto& job     = request.job;
  const auto& segment = request.record.segments(index);
  const auto  total   = request.record.segments_size();

  if (request.resume.count(segment.filename()) > 0) {
    STREAMLIFT_LOG_DEBUG("Segment already uploaded, skipping", {StringField("job_id", job.job_id), StringField("segment", segment.filename())});
    return false;
  }

  cancel.ThrowIfCancelled("segment " + segment.filename());

  auto body = storage::common::ReadLocalFile((fs::path(request.record.output_dir()) / segment.filename()).string());

  storage::PutOptions options;
  options.content_type  = kSegmentContentType;
  options.cache_control = kSegmentCacheControl;
  options.metadata      = {
      {"job-id", job.job_id},
      {"segment-index", std::to_string(index)},
      {"total-segments", std::to_string(total)},
  };
  store_->Put(layout_.SegmentKey(job, segment.filename()), body, options);

  session.RecordTransferred(static_cast<uint64_t>(body->size()));
  auto snapshot = session.Read();

  char line[96];
  std::snprintf(line, sizeof(line), "Segment %u/%d uploaded (%.1f%%)", snapshot.uploaded_segments, total,
                model::RoundToTenth(100.0 * snapshot.uploaded_segments / total));
  STREAMLIFT_LOG_INFO(line, {StringField("job_id", job.job_id), StringField("segment", segment.filename())});

  reporter.OnTransferProgress(snapshot, settings_.segment_duration_seconds);
  return true;
}

uint32_t TransferOrchestrator::RunBatch(const TransferRequest& request, uint32_t begin, uint32_t end, model::UploadSession& session,
                                        progress::ProgressReporter& reporter, const util::CancellationToken& cancel) {
  std::atomic<uint32_t> fresh{0};

  util::TaskGroup group;
  for (uint32_t i = begin; i < end; ++i) {
    group.Launch([&, i] {
      if (TransferSegment(request, static_cast<int>(i), session, reporter, cancel)) {
        fresh.fetch_add(1);
      }
    });
  }
  group.Wait();

  return fresh.load();
}

void TransferOrchestrator::Publish(const TransferRequest& request, uint32_t covered, uint32_t total) {
  manifest_->PublishTemplate(request.job, request.record.segments(), covered);
  manifest_->NotifyFinalize(request.job, covered, total);
}

void TransferOrchestrator::Run(const TransferRequest& request, model::UploadSession& session, progress::ProgressReporter& reporter,
                               const util::CancellationToken& cancel) {
  const auto&    job   = request.job;
  const uint32_t total = static_cast<uint32_t>(request.record.segments_size());
  if (total == 0) {
    throw util::InputError("conversion for " + job.job_id + " has no segments");
  }

  uint32_t resumed = 0;
  for (const auto& segment : request.record.segments()) {
    if (request.resume.count(segment.filename()) > 0) ++resumed;
  }

  session.SetTotalSegments(total);
  session.SetResumeCount(resumed);
  session.Transition(model::UploadStatus::kUploading);
  reporter.MarkTransferStart();

  STREAMLIFT_LOG_INFO("Starting transfer", {StringField("job_id", job.job_id), IntField("total_segments", total), IntField("skipped_segments", resumed),
                                            IntField("priority_segments", settings_.priority_segments),
                                            IntField("concurrent_uploads", settings_.concurrent_uploads)});

  // Phase 1: priority prefix, unbounded within the small set.
  const uint32_t priority = std::min(settings_.priority_segments, total);
  cancel.ThrowIfCancelled("priority phase");
  const uint32_t priority_fresh = RunBatch(request, 0, priority, session, reporter, cancel);

  uint32_t covered            = priority;
  size_t   milestones_reported = 0;
  if (priority_fresh > 0 || !request.manifest_artifacts_exist) {
    Publish(request, covered, total);
    milestones_reported = MilestonesReached(covered, total);
  } else {
    STREAMLIFT_LOG_INFO("Priority segments and manifest already present, not republishing", {StringField("job_id", job.job_id)});
  }

  session.Transition(model::UploadStatus::kReadyForPlayback);
  reporter.Milestone(model::UploadStatus::kReadyForPlayback, session.ProgressPercent(), "Ready for playback");

  UploadSubtitles(request, cancel);

  // Phase 2: bulk, batches of C with a barrier between them.
  for (uint32_t begin = priority; begin < total; begin += settings_.concurrent_uploads) {
    cancel.ThrowIfCancelled("bulk phase");

    const uint32_t end   = std::min(begin + settings_.concurrent_uploads, total);
    const uint32_t fresh = RunBatch(request, begin, end, session, reporter, cancel);
    covered              = end;

    const size_t reached = MilestonesReached(covered, total);
    if (fresh > 0 || reached > milestones_reported) {
      Publish(request, covered, total);
      milestones_reported = std::max(milestones_reported, reached);
    }
  }

  auto snapshot = session.Read();
  STREAMLIFT_LOG_INFO("Transfer finished", {StringField("job_id", job.job_id), IntField("uploaded_segments", snapshot.uploaded_segments),
                                            IntField("skipped_segments", snapshot.skipped_segments),
                                            IntField("transferred_this_run", snapshot.transferred_this_run),
                                            IntField("transferred_bytes", static_cast<int64_t>(snapshot.transferred_bytes))});
}

void TransferOrchestrator::UploadSubtitles(const TransferRequest& request, const util::CancellationToken& cancel) {
  for (const auto& subtitle : request.record.subtitles()) {
    cancel.ThrowIfCancelled("subtitle upload");
    try {
      auto body = storage::common::ReadLocalFile((fs::path(request.subtitle_dir) / subtitle.filename()).string());

      storage::PutOptions options;
      options.content_type = kSubtitleContentType;
      options.metadata     = {{"job-id", request.job.job_id}, {"language", subtitle.language()}};
      store_->Put(layout_.SubtitleKey(request.job, subtitle.filename()), body, options);

      STREAMLIFT_LOG_INFO("Subtitle uploaded", {StringField("job_id", request.job.job_id), StringField("subtitle", subtitle.filename()),
                                                StringField("origin", subtitle.origin())});
    } catch (const util::Cancelled&) {
      throw;
    } catch (const std::exception& e) {
      STREAMLIFT_LOG_WARN("Subtitle upload failed", {StringField("job_id", request.job.job_id), StringField("subtitle", subtitle.filename()),
                                                     StringField("error", e.what())});
    }
  }
}

} // namespace streamlift::transfer
