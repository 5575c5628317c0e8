#include "remote_state_probe.hpp"

#include "internal/model/segment_naming.hpp"
#include "internal/observability/logging.hpp"

namespace streamlift::resume {

using streamlift::observability::IntField;
using streamlift::observability::StringField;

RemoteStateProbe::RemoteStateProbe(storage::ObjectStorePtr store, storage::common::KeyLayout layout)
    : store_(std::move(store)), layout_(std::move(layout)) {
}

ResumeSet RemoteStateProbe::ExistingSegments(const model::TransferJob& job) const {
  const auto prefix = layout_.SegmentPrefix(job);

  std::vector<std::string> keys;
  try {
    keys = store_->List(prefix);
  } catch (const std::exception& e) {
    STREAMLIFT_LOG_WARN("Could not list existing segments, resending all", {StringField("job_id", job.job_id), StringField("error", e.what())});
    return {};
  }

  ResumeSet existing;
  for (const auto& key : keys) {
    if (key.compare(0, prefix.size(), prefix) != 0) continue;
    auto filename = key.substr(prefix.size());
    if (model::ParseSegmentOrdinal(filename)) {
      existing.insert(std::move(filename));
    }
  }

  STREAMLIFT_LOG_INFO("Resume set computed", {StringField("job_id", job.job_id), IntField("existing_segments", static_cast<int64_t>(existing.size()))});
  return existing;
}

bool RemoteStateProbe::ManifestArtifactsExist(const model::TransferJob& job) const {
  try {
    return store_->Head(layout_.TemplateKey(job)) && store_->Head(layout_.FinalManifestKey(job));
  } catch (const std::exception& e) {
    STREAMLIFT_LOG_WARN("Could not check manifest artifacts", {StringField("job_id", job.job_id), StringField("error", e.what())});
    return false;
  }
}

} // namespace streamlift::resume
