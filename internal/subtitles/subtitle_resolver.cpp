#include "subtitle_resolver.hpp"

#include <filesystem>
#include <fstream>
#include <optional>

#include "internal/observability/logging.hpp"
#include "internal/subtitles/archive.hpp"
#include "internal/subtitles/srt_to_vtt.hpp"
#include "internal/subtitles/title_parser.hpp"
#include "internal/subtitles/track_selection.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/task_group.hpp"

namespace streamlift::subtitles {

namespace fs = std::filesystem;

using streamlift::observability::IntField;
using streamlift::observability::StringField;

namespace {

streamlift::v1::SubtitleEntry MakeEntry(const std::string& filename, const std::string& origin) {
  streamlift::v1::SubtitleEntry entry;
  entry.set_filename(filename);
  entry.set_language("en");
  entry.set_label("English");
  entry.set_origin(origin);
  return entry;
}

void WriteText(const fs::path& path, const std::string& text) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << text;
  if (!out) throw util::TransientIoError("cannot write " + path.string());
}

} // namespace

SubtitleResolver::SubtitleResolver(transcode::TranscoderPtr transcoder, std::shared_ptr<SubtitleSearchClient> search, SubtitleSettings settings)
    : transcoder_(std::move(transcoder)), search_(std::move(search)), settings_(std::move(settings)) {
}

std::vector<streamlift::v1::SubtitleEntry> SubtitleResolver::Resolve(const std::string& job_id, const std::string& source_path,
                                                                     const transcode::MediaInfo& info, const std::string& subtitle_dir,
                                                                     const util::CancellationToken& cancel) {
  if (!settings_.enabled) return {};

  std::error_code ec;
  fs::create_directories(subtitle_dir, ec);
  if (ec) {
    STREAMLIFT_LOG_WARN("Cannot create subtitle directory", {StringField("job_id", job_id), StringField("error", ec.message())});
    return {};
  }

  auto entries = ExtractEmbedded(job_id, source_path, info, subtitle_dir, cancel);
  if (entries.empty()) {
    entries = SearchAndDownload(job_id, source_path, subtitle_dir, cancel);
  }

  STREAMLIFT_LOG_INFO("Subtitles resolved", {StringField("job_id", job_id), IntField("count", static_cast<int64_t>(entries.size()))});
  return entries;
}

std::vector<streamlift::v1::SubtitleEntry> SubtitleResolver::ExtractEmbedded(const std::string& job_id, const std::string& source_path,
                                                                             const transcode::MediaInfo& info, const std::string& subtitle_dir,
                                                                             const util::CancellationToken& cancel) {
  std::vector<streamlift::v1::SubtitleEntry> entries;
  for (const auto& track : SelectEnglishTracks(info.subtitle_streams)) {
    const auto filename = "embedded_" + std::to_string(track.index) + ".en.vtt";
    try {
      transcoder_->ExtractSubtitle(source_path, track.index, (fs::path(subtitle_dir) / filename).string(), cancel);
      entries.push_back(MakeEntry(filename, "embedded"));
    } catch (const util::Cancelled&) {
      throw;
    } catch (const std::exception& e) {
      STREAMLIFT_LOG_WARN("Subtitle extraction failed",
                          {StringField("job_id", job_id), IntField("stream", track.index), StringField("error", e.what())});
    }
  }
  return entries;
}

std::vector<streamlift::v1::SubtitleEntry> SubtitleResolver::SearchAndDownload(const std::string& job_id, const std::string& source_path,
                                                                               const std::string& subtitle_dir,
                                                                               const util::CancellationToken& cancel) {
  if (!search_) return {};

  const auto parsed = ParseTitle(fs::path(source_path).stem().string());
  if (parsed.title.empty()) return {};

  std::vector<streamlift::v1::SubtitleCandidate> candidates;
  try {
    candidates = search_->Search(parsed.title, parsed.year);
  } catch (const std::exception& e) {
    STREAMLIFT_LOG_WARN("Subtitle search failed", {StringField("job_id", job_id), StringField("title", parsed.title), StringField("error", e.what())});
    return {};
  }
  if (candidates.size() > settings_.max_candidates) candidates.resize(settings_.max_candidates);

  std::vector<std::optional<streamlift::v1::SubtitleEntry>> results(candidates.size());

  util::TaskGroup group;
  for (size_t i = 0; i < candidates.size(); ++i) {
    group.Launch([&, i] {
      const auto filename = "search_" + std::to_string(i) + ".en.vtt";
      try {
        cancel.ThrowIfCancelled("subtitle download");
        auto bytes = search_->Download(candidates[i].download_url());
        if (IsZipArchive(bytes)) {
          bytes = ExtractSubtitleFromZip(bytes, (fs::path(subtitle_dir) / ("archive_" + std::to_string(i))).string(), settings_.unzip_path, cancel);
        }
        WriteText(fs::path(subtitle_dir) / filename, IsWebVtt(bytes) ? bytes : SrtToVtt(bytes));
        results[i] = MakeEntry(filename, "search");
      } catch (const util::Cancelled&) {
        throw;
      } catch (const std::exception& e) {
        STREAMLIFT_LOG_WARN("Subtitle candidate failed", {StringField("job_id", job_id), StringField("url", candidates[i].download_url()),
                                                          StringField("error", e.what())});
      }
    });
  }
  group.Wait();

  std::vector<streamlift::v1::SubtitleEntry> entries;
  for (auto& result : results) {
    if (result) entries.push_back(std::move(*result));
  }
  return entries;
}

} // namespace streamlift::subtitles
