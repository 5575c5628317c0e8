#include "ffmpeg_transcoder.hpp"

#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <cstdlib>
#include <filesystem>

#include "internal/model/segment_naming.hpp"
#include "internal/observability/logging.hpp"
#include "internal/transcode/codec_plan.hpp"
#include "internal/transcode/progress_parser.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/subprocess.hpp"
#include "streamlift/v1/probe.pb.h"

namespace streamlift::transcode {

namespace fs = std::filesystem;

using streamlift::observability::BoolField;
using streamlift::observability::DoubleField;
using streamlift::observability::IntField;
using streamlift::observability::StringField;

namespace {

std::string FirstLine(const std::string& text) {
  return text.substr(0, text.find('\n'));
}

std::string Tag(const streamlift::v1::ProbeStream& stream, const std::string& key) {
  auto it = stream.tags().find(key);
  return it == stream.tags().end() ? std::string{} : it->second;
}

} // namespace

MediaInfo ParseProbeJson(const std::string& json) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  streamlift::v1::ProbeResult probe;
  auto                        status = google::protobuf::util::JsonStringToMessage(json, &probe, options);
  if (!status.ok()) {
    throw util::InputError("unreadable probe output: " + std::string(status.message()));
  }

  MediaInfo info;
  info.duration_seconds = std::strtod(probe.format().duration().c_str(), nullptr);
  info.bit_rate         = std::strtoll(probe.format().bit_rate().c_str(), nullptr, 10);

  for (const auto& stream : probe.streams()) {
    if (stream.codec_type() == "video" && info.video_codec.empty()) {
      info.video_codec = stream.codec_name();
      info.width       = stream.width();
      info.height      = stream.height();
    } else if (stream.codec_type() == "audio" && info.audio_codec.empty()) {
      info.audio_codec = stream.codec_name();
    } else if (stream.codec_type() == "subtitle") {
      SubtitleStream subtitle;
      subtitle.index    = stream.index();
      subtitle.codec    = stream.codec_name();
      subtitle.language = Tag(stream, "language");
      subtitle.title    = Tag(stream, "title");
      info.subtitle_streams.push_back(std::move(subtitle));
    }
  }
  return info;
}

std::vector<std::string> ListSegmentFiles(const std::string& output_dir) {
  std::vector<std::string> files;
  std::error_code          ec;
  for (const auto& entry : fs::directory_iterator(output_dir, ec)) {
    if (!entry.is_regular_file()) continue;
    auto name = entry.path().filename().string();
    if (name.rfind(model::kSegmentPrefix, 0) != 0) continue;
    if (!model::ParseSegmentOrdinal(name)) {
      throw util::TransientIoError("unexpected segment file name: " + name);
    }
    files.push_back(std::move(name));
  }
  if (ec) {
    throw util::TransientIoError("cannot list " + output_dir + ": " + ec.message());
  }
  if (files.empty()) {
    throw util::TransientIoError("transcoder produced no segments in " + output_dir);
  }

  std::sort(files.begin(), files.end());
  for (size_t i = 0; i < files.size(); ++i) {
    if (*model::ParseSegmentOrdinal(files[i]) != i) {
      throw util::TransientIoError("segment sequence has a gap before " + files[i]);
    }
  }
  return files;
}

FfmpegTranscoder::FfmpegTranscoder(std::string ffmpeg_path, std::string ffprobe_path)
    : ffmpeg_(ffmpeg_path.empty() ? "ffmpeg" : std::move(ffmpeg_path)), ffprobe_(ffprobe_path.empty() ? "ffprobe" : std::move(ffprobe_path)) {
}

MediaInfo FfmpegTranscoder::Probe(const std::string& source_path, const util::CancellationToken& cancel) {
  auto result =
      util::RunProcess({ffprobe_, "-v", "quiet", "-print_format", "json", "-show_format", "-show_streams", source_path}, {}, cancel);
  if (result.exit_code != 0) {
    throw util::InputError("ffprobe failed for " + source_path + " (exit " + std::to_string(result.exit_code) + ")");
  }

  auto info = ParseProbeJson(result.stdout_data);
  if (info.video_codec.empty()) {
    throw util::InputError("no video stream in " + source_path);
  }
  return info;
}

TranscodeResult FfmpegTranscoder::Transcode(const std::string& source_path, const std::string& output_dir, const CodecPlan& plan,
                                            const ProgressCallback& on_progress, const util::CancellationToken& cancel) {
  std::error_code ec;
  fs::create_directories(output_dir, ec);
  if (ec) {
    throw util::TransientIoError("cannot create " + output_dir + ": " + ec.message());
  }

  STREAMLIFT_LOG_INFO("Transcoding", {StringField("source", source_path), StringField("output_dir", output_dir),
                                      BoolField("copy_video", plan.copy_video), BoolField("copy_audio", plan.copy_audio),
                                      IntField("segment_duration_seconds", plan.segment_duration_seconds)});

  double elapsed = 0.0;
  auto   args    = BuildTranscodeArgs(ffmpeg_, source_path, output_dir, plan);
  auto   result  = util::RunProcess(
      args,
      [&](const std::string& line) {
        auto progress = ParseProgressLine(line);
        if (!progress) return;
        elapsed = std::max(elapsed, progress->elapsed_seconds);
        if (on_progress) on_progress(*progress);
      },
      cancel);

  if (result.exit_code != 0) {
    throw util::TransientIoError("ffmpeg exited with " + std::to_string(result.exit_code) + ": " + result.stderr_tail);
  }

  TranscodeResult out;
  out.segment_files    = ListSegmentFiles(output_dir);
  out.duration_seconds = elapsed;

  STREAMLIFT_LOG_INFO("Transcode finished", {StringField("output_dir", output_dir), IntField("segments", static_cast<int64_t>(out.segment_files.size())),
                                             DoubleField("duration_seconds", out.duration_seconds)});
  return out;
}

void FfmpegTranscoder::ExtractSubtitle(const std::string& source_path, int stream_index, const std::string& output_path,
                                       const util::CancellationToken& cancel) {
  auto result = util::RunProcess({ffmpeg_, "-hide_banner", "-y", "-i", source_path, "-map", "0:" + std::to_string(stream_index), "-c:s",
                                  "webvtt", "-f", "webvtt", output_path},
                                 {}, cancel);
  if (result.exit_code != 0) {
    throw util::TransientIoError("subtitle extraction of stream " + std::to_string(stream_index) + " failed: " + result.stderr_tail);
  }
}

std::string FfmpegTranscoder::CheckAvailable() {
  std::string detail;
  for (const auto& tool : {ffmpeg_, ffprobe_}) {
    auto result = util::RunProcess({tool, "-version"});
    if (result.exit_code != 0) {
      throw util::TransientIoError(tool + " is not available (exit " + std::to_string(result.exit_code) + ")");
    }
    if (!detail.empty()) detail += "\n";
    detail += FirstLine(result.stdout_data);
  }
  return detail;
}

} // namespace streamlift::transcode
