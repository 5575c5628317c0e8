#include "codec_plan.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <filesystem>

#include "internal/model/segment_naming.hpp"

namespace streamlift::transcode {

namespace {

std::string Lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

template <size_t N>
bool Contains(const std::array<const char*, N>& values, const std::string& needle) {
  auto lowered = Lower(needle);
  return std::any_of(values.begin(), values.end(), [&](const char* v) { return lowered == v; });
}

constexpr std::array<const char*, 5> kSourceExtensions = {".mp4", ".mkv", ".avi", ".mov", ".m4v"};
constexpr std::array<const char*, 6> kVideoCopy        = {"h264", "avc", "hevc", "h265", "vp9", "av01"};
constexpr std::array<const char*, 3> kAudioCopy        = {"aac", "mp3", "opus"};
constexpr std::array<const char*, 3> kBitmapSubtitles  = {"hdmv_pgs_subtitle", "dvd_subtitle", "dvb_subtitle"};

} // namespace

bool IsSupportedSource(const std::string& path) {
  return Contains(kSourceExtensions, std::filesystem::path(path).extension().string());
}

bool IsStreamableVideoCodec(const std::string& codec) {
  return Contains(kVideoCopy, codec);
}

bool IsStreamableAudioCodec(const std::string& codec) {
  return Contains(kAudioCopy, codec);
}

bool IsTextSubtitleCodec(const std::string& codec) {
  return !codec.empty() && !Contains(kBitmapSubtitles, codec);
}

CodecPlan PlanCodecs(const MediaInfo& info, uint32_t segment_duration_seconds) {
  CodecPlan plan;
  plan.copy_video = IsStreamableVideoCodec(info.video_codec);
  // No audio stream: nothing to encode, "copy" maps no audio at all.
  plan.copy_audio               = info.audio_codec.empty() || IsStreamableAudioCodec(info.audio_codec);
  plan.segment_duration_seconds = segment_duration_seconds;
  return plan;
}

std::vector<std::string> BuildTranscodeArgs(const std::string& ffmpeg, const std::string& source_path, const std::string& output_dir,
                                            const CodecPlan& plan) {
  namespace fs = std::filesystem;

  std::vector<std::string> args = {ffmpeg, "-hide_banner", "-y", "-i", source_path, "-map", "0:v:0", "-map", "0:a:0?"};

  if (plan.copy_video) {
    args.insert(args.end(), {"-c:v", "copy"});
  } else {
    args.insert(args.end(), {"-c:v", "libx264", "-preset", "fast", "-crf", "23", "-profile:v", "high", "-level:v", "4.0"});
  }

  if (plan.copy_audio) {
    args.insert(args.end(), {"-c:a", "copy"});
  } else {
    args.insert(args.end(), {"-c:a", "aac", "-b:a", "128k"});
  }

  const auto segment_pattern = (fs::path(output_dir) / (std::string(model::kSegmentPrefix) + "%06d" + model::kSegmentExtension)).string();
  const auto playlist        = (fs::path(output_dir) / "playlist.m3u8").string();

  args.insert(args.end(), {"-sc_threshold", "0", "-g", "48", "-keyint_min", "48", "-hls_time", std::to_string(plan.segment_duration_seconds),
                           "-hls_playlist_type", "vod", "-hls_segment_filename", segment_pattern, "-f", "hls", playlist});
  return args;
}

} // namespace streamlift::transcode
