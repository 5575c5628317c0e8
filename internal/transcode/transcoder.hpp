#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/util/cancellation.hpp"

namespace streamlift::transcode {

struct SubtitleStream {
  // Absolute stream index in the container.
  int         index = 0;
  std::string codec;
  std::string language;
  std::string title;
};

struct MediaInfo {
  double      duration_seconds = 0.0;
  std::string video_codec;
  std::string audio_codec;
  int         width    = 0;
  int         height   = 0;
  int64_t     bit_rate = 0;

  std::vector<SubtitleStream> subtitle_streams;
};

struct CodecPlan {
  bool copy_video = true;
  bool copy_audio = true;
  // Nominal segment length handed to the segmenter.
  uint32_t segment_duration_seconds = 10;
};

struct TranscodeProgress {
  double elapsed_seconds = 0.0;
  // Encoder speed relative to realtime (1.0 = realtime). 0 when unknown.
  double speed = 0.0;
};

using ProgressCallback = std::function<void(const TranscodeProgress&)>;

struct TranscodeResult {
  // segment_000000.ts ... in ordinal order, contiguous from 0.
  std::vector<std::string> segment_files;
  double                   duration_seconds = 0.0;
};

/*
  Wraps the external transcoding tool.

  All calls block; a tripped token kills the running child and throws
  util::Cancelled. Tool failures raise util::TransientIoError, unusable
  sources util::InputError.
*/
class Transcoder {
 public:
  virtual ~Transcoder() = default;

  virtual MediaInfo Probe(const std::string& source_path, const util::CancellationToken& cancel) = 0;

  virtual TranscodeResult Transcode(const std::string& source_path, const std::string& output_dir, const CodecPlan& plan,
                                    const ProgressCallback& on_progress, const util::CancellationToken& cancel) = 0;

  // Writes stream_index of source_path as WebVTT to output_path.
  virtual void ExtractSubtitle(const std::string& source_path, int stream_index, const std::string& output_path,
                               const util::CancellationToken& cancel) = 0;

  // Version banner of the tools; throws util::TransientIoError when missing.
  virtual std::string CheckAvailable() = 0;
};

using TranscoderPtr = std::shared_ptr<Transcoder>;

} // namespace streamlift::transcode
