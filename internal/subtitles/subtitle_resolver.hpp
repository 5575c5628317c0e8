#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/subtitles/subtitle_search_client.hpp"
#include "internal/transcode/transcoder.hpp"
#include "internal/util/cancellation.hpp"
#include "streamlift/v1/conversion.pb.h"

namespace streamlift::subtitles {

struct SubtitleSettings {
  bool        enabled        = true;
  uint32_t    max_candidates = 5;
  std::string unzip_path     = "unzip";
};

/*
  Produces English WebVTT files for a freshly transcoded job.

  Embedded English tracks are extracted first. Only when none result is the
  search service asked, by title and year parsed from the source file name;
  up to max_candidates downloads run in parallel and each one succeeds or
  fails on its own.

  Never throws except util::Cancelled: subtitles are best-effort.
*/
class SubtitleResolver {
 public:
  // search may be null (no search service configured).
  SubtitleResolver(transcode::TranscoderPtr transcoder, std::shared_ptr<SubtitleSearchClient> search, SubtitleSettings settings);

  std::vector<streamlift::v1::SubtitleEntry> Resolve(const std::string& job_id, const std::string& source_path, const transcode::MediaInfo& info,
                                                     const std::string& subtitle_dir, const util::CancellationToken& cancel);

 private:
  std::vector<streamlift::v1::SubtitleEntry> ExtractEmbedded(const std::string& job_id, const std::string& source_path,
                                                             const transcode::MediaInfo& info, const std::string& subtitle_dir,
                                                             const util::CancellationToken& cancel);

  std::vector<streamlift::v1::SubtitleEntry> SearchAndDownload(const std::string& job_id, const std::string& source_path,
                                                               const std::string& subtitle_dir, const util::CancellationToken& cancel);

  transcode::TranscoderPtr              transcoder_;
  std::shared_ptr<SubtitleSearchClient> search_;
  SubtitleSettings                      settings_;
};

} // namespace streamlift::subtitles
