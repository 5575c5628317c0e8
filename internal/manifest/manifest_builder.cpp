#include "manifest_builder.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

#include "internal/observability/logging.hpp"

namespace streamlift::manifest {

using streamlift::observability::BoolField;
using streamlift::observability::IntField;
using streamlift::observability::StringField;

namespace {

constexpr const char* kTemplateContentType  = "application/vnd.apple.mpegurl";
constexpr const char* kTemplateCacheControl = "no-cache, no-store, must-revalidate";

std::string FormatDuration(double seconds) {
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%.1f", seconds);
  return buffer;
}

} // namespace

std::string RenderTemplate(const SegmentList& segments, uint32_t count) {
  const auto listed = std::min<uint32_t>(count, static_cast<uint32_t>(segments.size()));

  double longest = 0.0;
  for (uint32_t i = 0; i < listed; ++i) longest = std::max(longest, segments.Get(i).duration_seconds());

  std::string out;
  out += "#EXTM3U\n";
  out += "#EXT-X-VERSION:3\n";
  out += "#EXT-X-TARGETDURATION:" + std::to_string(static_cast<int>(std::ceil(longest))) + "\n";
  out += "#EXT-X-MEDIA-SEQUENCE:0\n";
  for (uint32_t i = 0; i < listed; ++i) {
    const auto& segment = segments.Get(i);
    out += "#EXTINF:" + FormatDuration(segment.duration_seconds()) + ",\n";
    out += segment.filename() + "\n";
  }
  return out;
}

ManifestBuilder::ManifestBuilder(storage::ObjectStorePtr store, storage::common::KeyLayout layout, api::ManifestFinalizerPtr finalizer)
    : store_(std::move(store)), layout_(std::move(layout)), finalizer_(std::move(finalizer)) {
}

void ManifestBuilder::PublishTemplate(const model::TransferJob& job, const SegmentList& segments, uint32_t count) {
  auto body = RenderTemplate(segments, count);

  storage::PutOptions options;
  options.content_type  = kTemplateContentType;
  options.cache_control = kTemplateCacheControl;
  store_->Put(layout_.TemplateKey(job), arrow::Buffer::FromString(std::move(body)), options);

  STREAMLIFT_LOG_INFO("Manifest template published", {StringField("job_id", job.job_id), IntField("entries", count)});
}

void ManifestBuilder::NotifyFinalize(const model::TransferJob& job, uint32_t count, uint32_t total) {
  const bool complete = count >= total;
  finalizer_->Finalize(job, count, total, complete);

  STREAMLIFT_LOG_INFO("Manifest finalize requested",
                      {StringField("job_id", job.job_id), IntField("segment_count", count), IntField("total_segments", total), BoolField("is_complete", complete)});
}

} // namespace streamlift::manifest
