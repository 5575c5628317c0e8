#include "conversion_cache.hpp"

#include <google/protobuf/util/json_util.h>

#include <filesystem>
#include <fstream>
#include <sstream>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/key_layout.hpp"
#include "internal/util/errors.hpp"

namespace streamlift::conversion {

namespace fs = std::filesystem;

using streamlift::observability::IntField;
using streamlift::observability::StringField;

namespace {

std::optional<std::string> ReadText(const fs::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return std::nullopt;
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

} // namespace

ConversionCache::ConversionCache(std::string staging_dir) : staging_dir_(std::move(staging_dir)) {
  if (staging_dir_.empty()) {
    throw std::invalid_argument("staging directory must not be empty");
  }
}

std::string ConversionCache::JobDir(const std::string& job_id) const {
  storage::common::ValidateKeyComponent(job_id, "job id");
  return (fs::path(staging_dir_) / job_id).string();
}

std::string ConversionCache::SegmentDir(const std::string& job_id) const {
  return (fs::path(JobDir(job_id)) / "segments").string();
}

std::string ConversionCache::SubtitleDir(const std::string& job_id) const {
  return (fs::path(JobDir(job_id)) / "subtitles").string();
}

std::string ConversionCache::RecordPath(const std::string& job_id) const {
  return (fs::path(JobDir(job_id)) / "conversion.json").string();
}

std::optional<streamlift::v1::ConversionRecord> ConversionCache::TryReuse(const std::string& job_id) const {
  const auto path = RecordPath(job_id);
  auto       text = ReadText(path);
  if (!text) return std::nullopt;

  auto discard = [&](const std::string& reason) -> std::optional<streamlift::v1::ConversionRecord> {
    STREAMLIFT_LOG_WARN("Discarding conversion record", {StringField("job_id", job_id), StringField("reason", reason)});
    std::error_code ec;
    fs::remove(path, ec);
    return std::nullopt;
  };

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  streamlift::v1::ConversionRecord record;
  auto                             status = google::protobuf::util::JsonStringToMessage(*text, &record, options);
  if (!status.ok()) {
    return discard("unparsable: " + std::string(status.message()));
  }
  if (record.total_count() == 0) {
    return discard("zero segments");
  }
  if (record.total_count() != static_cast<uint32_t>(record.segments_size())) {
    return discard("segment count mismatch");
  }

  for (const auto& segment : record.segments()) {
    std::error_code ec;
    if (!fs::is_regular_file(fs::path(record.output_dir()) / segment.filename(), ec)) {
      return discard("missing " + segment.filename());
    }
  }

  // Subtitles are best-effort: drop the ones that vanished, keep the record.
  auto* subtitles = record.mutable_subtitles();
  for (int i = subtitles->size() - 1; i >= 0; --i) {
    std::error_code ec;
    if (!fs::is_regular_file(fs::path(SubtitleDir(job_id)) / subtitles->Get(i).filename(), ec)) {
      subtitles->DeleteSubrange(i, 1);
    }
  }
  record.set_has_subtitles(record.subtitles_size() > 0);

  STREAMLIFT_LOG_INFO("Reusing existing conversion", {StringField("job_id", job_id), IntField("segments", record.total_count())});
  return record;
}

void ConversionCache::Persist(const std::string& job_id, const streamlift::v1::ConversionRecord& record) const {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(record, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("failed to encode conversion record: " + std::string(status.message()));
  }

  const fs::path final_path = RecordPath(job_id);
  const fs::path tmp_path   = final_path.string() + ".tmp";

  std::error_code ec;
  fs::create_directories(final_path.parent_path(), ec);
  if (ec) {
    throw util::TransientIoError("cannot create " + final_path.parent_path().string() + ": " + ec.message());
  }

  {
    std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
    out << json;
    out.flush();
    if (!out) {
      throw util::TransientIoError("cannot write " + tmp_path.string());
    }
  }

  fs::rename(tmp_path, final_path, ec);
  if (ec) {
    throw util::TransientIoError("cannot rename " + tmp_path.string() + ": " + ec.message());
  }
}

bool ConversionCache::Discard(const std::string& job_id) const {
  std::error_code ec;
  auto            removed = fs::remove_all(JobDir(job_id), ec);
  if (ec) {
    throw util::TransientIoError("cannot remove " + JobDir(job_id) + ": " + ec.message());
  }
  return removed > 0;
}

} // namespace streamlift::conversion
