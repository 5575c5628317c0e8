#pragma once

#include <string>

namespace streamlift::subtitles {

/*
  SubRip → WebVTT, pure text transform:
    - "WEBVTT" header
    - numeric cue counters dropped
    - "00:00:01,500" → "00:00:01.500" on timing lines only
    - cues separated by exactly one blank line
  CRLF input and a UTF-8 BOM are accepted.
*/
std::string SrtToVtt(const std::string& srt);

// True when text already starts with the WEBVTT signature.
bool IsWebVtt(const std::string& text);

} // namespace streamlift::subtitles
