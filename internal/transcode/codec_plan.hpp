#pragma once

#include <string>
#include <vector>

#include "internal/transcode/transcoder.hpp"

namespace streamlift::transcode {

// .mp4 .mkv .avi .mov .m4v, case-insensitive.
bool IsSupportedSource(const std::string& path);

bool IsStreamableVideoCodec(const std::string& codec);
bool IsStreamableAudioCodec(const std::string& codec);

// Text subtitle codecs only; bitmap subtitles cannot become WebVTT.
bool IsTextSubtitleCodec(const std::string& codec);

CodecPlan PlanCodecs(const MediaInfo& info, uint32_t segment_duration_seconds);

std::vector<std::string> BuildTranscodeArgs(const std::string& ffmpeg, const std::string& source_path, const std::string& output_dir,
                                            const CodecPlan& plan);

} // namespace streamlift::transcode
