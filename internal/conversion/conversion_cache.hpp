#pragma once

#include <optional>
#include <string>

#include "streamlift/v1/conversion.pb.h"

namespace streamlift::conversion {

/*
  Persists the description of a finished transcode beside its segments.

  Layout:
      <staging_dir>/<job_id>/conversion.json
      <staging_dir>/<job_id>/segments/segment_000000.ts ...

  A record is reusable only when it parses, total_count is non-zero and
  equals the number of listed segments, and every listed segment file is
  still on disk. Anything else is discarded and the caller transcodes again.
*/
class ConversionCache {
 public:
  explicit ConversionCache(std::string staging_dir);

  std::optional<streamlift::v1::ConversionRecord> TryReuse(const std::string& job_id) const;

  // Atomic replace: written to conversion.json.tmp, then renamed.
  void Persist(const std::string& job_id, const streamlift::v1::ConversionRecord& record) const;

  std::string JobDir(const std::string& job_id) const;
  std::string SegmentDir(const std::string& job_id) const;
  std::string SubtitleDir(const std::string& job_id) const;
  std::string RecordPath(const std::string& job_id) const;

  // Removes the whole job directory. Returns false if nothing was removed.
  bool Discard(const std::string& job_id) const;

 private:
  std::string staging_dir_;
};

} // namespace streamlift::conversion
