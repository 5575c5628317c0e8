#pragma once

#include <stdexcept>
#include <string>

#include "internal/model/transfer_job.hpp"

namespace streamlift::storage::common {

inline void ValidateKeyComponent(const std::string& component, const char* what) {
  if (component.empty()) {
    throw std::invalid_argument(std::string(what) + " must not be empty");
  }
  for (char c : component) {
    if (c == '/' || c == '\\' || c == '\0') {
      throw std::invalid_argument(std::string(what) + " contains invalid character");
    }
  }
  if (component == "." || component == "..") {
    throw std::invalid_argument(std::string(what) + " must not be a relative path component");
  }
}

inline std::string JoinKey(const std::string& left, const std::string& right) {
  if (left.empty()) return right;
  if (left.back() == '/') return left + right;
  return left + "/" + right;
}

/*
  Object key layout:

      <media_path>/<tenant>/<kind>/<job_id>/segments/<filename>
      <media_path>/<tenant>/<kind>/<job_id>/subtitles/<filename>
      <media_path>/<tenant>/<kind>/<job_id>/playlist-template.m3u8
      <playlist_path>/<tenant>/<kind>/<job_id>/playlist.m3u8     (written by the finalizer)
*/
class KeyLayout {
 public:
  KeyLayout(std::string media_path, std::string playlist_path)
      : media_path_(std::move(media_path)), playlist_path_(std::move(playlist_path)) {
  }

  std::string JobPrefix(const model::TransferJob& job) const {
    return Scoped(media_path_, job);
  }

  std::string SegmentPrefix(const model::TransferJob& job) const {
    return JoinKey(JobPrefix(job), "segments/");
  }

  std::string SegmentKey(const model::TransferJob& job, const std::string& filename) const {
    ValidateKeyComponent(filename, "segment filename");
    return SegmentPrefix(job) + filename;
  }

  std::string SubtitleKey(const model::TransferJob& job, const std::string& filename) const {
    ValidateKeyComponent(filename, "subtitle filename");
    return JoinKey(JobPrefix(job), "subtitles/" + filename);
  }

  std::string TemplateKey(const model::TransferJob& job) const {
    return JoinKey(JobPrefix(job), "playlist-template.m3u8");
  }

  std::string FinalManifestKey(const model::TransferJob& job) const {
    return JoinKey(Scoped(playlist_path_, job), "playlist.m3u8");
  }

  const std::string& MediaPath() const {
    return media_path_;
  }

  const std::string& PlaylistPath() const {
    return playlist_path_;
  }

 private:
  static std::string Scoped(const std::string& root, const model::TransferJob& job) {
    ValidateKeyComponent(job.tenant, "tenant");
    ValidateKeyComponent(job.job_id, "job id");
    return JoinKey(JoinKey(JoinKey(root, job.tenant), std::string(model::ToString(job.kind))), job.job_id);
  }

  std::string media_path_;
  std::string playlist_path_;
};

} // namespace streamlift::storage::common
