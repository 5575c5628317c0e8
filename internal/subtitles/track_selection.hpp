#pragma once

#include <vector>

#include "internal/transcode/transcoder.hpp"

namespace streamlift::subtitles {

/*
  Embedded text tracks treated as English:
    - language tag eng / en / english, or
    - title mentioning "english", or
    - the first text track when no track carries a language tag at all.
  Bitmap tracks are never selected.
*/
std::vector<transcode::SubtitleStream> SelectEnglishTracks(const std::vector<transcode::SubtitleStream>& streams);

} // namespace streamlift::subtitles
