#include "track_selection.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>

#include "internal/transcode/codec_plan.hpp"

namespace streamlift::subtitles {

namespace {

std::string Lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

bool IsEnglish(const transcode::SubtitleStream& stream) {
  const auto language = Lower(stream.language);
  if (language == "eng" || language == "en" || language == "english") return true;
  return Lower(stream.title).find("english") != std::string::npos;
}

} // namespace

std::vector<transcode::SubtitleStream> SelectEnglishTracks(const std::vector<transcode::SubtitleStream>& streams) {
  std::vector<transcode::SubtitleStream> text;
  for (const auto& stream : streams) {
    if (transcode::IsTextSubtitleCodec(stream.codec)) text.push_back(stream);
  }

  std::vector<transcode::SubtitleStream> selected;
  std::copy_if(text.begin(), text.end(), std::back_inserter(selected), IsEnglish);
  if (!selected.empty()) return selected;

  const bool any_tagged = std::any_of(streams.begin(), streams.end(), [](const auto& s) { return !s.language.empty(); });
  if (!any_tagged && !text.empty()) {
    selected.push_back(text.front());
  }
  return selected;
}

} // namespace streamlift::subtitles
