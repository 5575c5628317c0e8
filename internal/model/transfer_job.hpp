#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace streamlift::model {

enum class MediaKind {
  kMovie,
  kEpisode,
};

inline std::string_view ToString(MediaKind kind) {
  return kind == MediaKind::kEpisode ? "episode" : "movie";
}

inline std::optional<MediaKind> ParseMediaKind(std::string_view value) {
  if (value == "movie") return MediaKind::kMovie;
  if (value == "episode") return MediaKind::kEpisode;
  return std::nullopt;
}

/*
  One request to convert-and-upload a single media item.

  job_id is the opaque content id; at most one job per id is in flight.
*/
struct TransferJob {
  std::string job_id;
  std::string source_path;
  // Tenant/owner scope used in object keys and API paths.
  std::string tenant;
  MediaKind   kind = MediaKind::kMovie;
};

} // namespace streamlift::model
