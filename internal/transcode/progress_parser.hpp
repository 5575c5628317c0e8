#pragma once

#include <optional>
#include <string>

#include "internal/transcode/transcoder.hpp"

namespace streamlift::transcode {

/*
  Parses one ffmpeg status line:

      frame= 1234 fps=240 q=-1.0 size=N/A time=00:01:23.45 bitrate=N/A speed=4.82x

  Returns nullopt when the line carries no time= field.
*/
std::optional<TranscodeProgress> ParseProgressLine(const std::string& line);

// "HH:MM:SS.xx" → seconds; nullopt on malformed input.
std::optional<double> ParseClock(const std::string& value);

} // namespace streamlift::transcode
