#pragma once

#include <string>
#include <vector>

#include "internal/transcode/transcoder.hpp"

namespace streamlift::transcode {

/*
  Transcoder backed by the ffmpeg / ffprobe command-line tools.
*/
class FfmpegTranscoder final : public Transcoder {
 public:
  FfmpegTranscoder(std::string ffmpeg_path, std::string ffprobe_path);

  MediaInfo Probe(const std::string& source_path, const util::CancellationToken& cancel) override;

  TranscodeResult Transcode(const std::string& source_path, const std::string& output_dir, const CodecPlan& plan,
                            const ProgressCallback& on_progress, const util::CancellationToken& cancel) override;

  void ExtractSubtitle(const std::string& source_path, int stream_index, const std::string& output_path,
                       const util::CancellationToken& cancel) override;

  std::string CheckAvailable() override;

 private:
  std::string ffmpeg_;
  std::string ffprobe_;
};

/*
  Parses `ffprobe -print_format json -show_format -show_streams` output.
  The first video and first audio stream win.
*/
MediaInfo ParseProbeJson(const std::string& json);

/*
  Segment files of output_dir in ordinal order. Throws
  util::TransientIoError when the sequence is empty or has a gap.
*/
std::vector<std::string> ListSegmentFiles(const std::string& output_dir);

} // namespace streamlift::transcode
