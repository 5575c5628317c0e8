#include "srt_to_vtt.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <vector>

namespace streamlift::subtitles {

namespace {

std::string StripBom(const std::string& text) {
  if (text.size() >= 3 && static_cast<unsigned char>(text[0]) == 0xEF && static_cast<unsigned char>(text[1]) == 0xBB &&
      static_cast<unsigned char>(text[2]) == 0xBF) {
    return text.substr(3);
  }
  return text;
}

bool IsBlank(const std::string& line) {
  return std::all_of(line.begin(), line.end(), [](unsigned char c) { return std::isspace(c); });
}

bool IsCounter(const std::string& line) {
  return !line.empty() && std::all_of(line.begin(), line.end(), [](unsigned char c) { return std::isdigit(c); });
}

std::string ConvertTiming(std::string line) {
  std::replace(line.begin(), line.end(), ',', '.');
  return line;
}

void EmitCue(std::vector<std::string>& cue, std::ostringstream& out) {
  if (cue.empty()) return;

  size_t start = 0;
  if (cue.size() > 1 && IsCounter(cue[0]) && cue[1].find("-->") != std::string::npos) {
    start = 1;
  }
  for (size_t i = start; i < cue.size(); ++i) {
    out << (cue[i].find("-->") != std::string::npos ? ConvertTiming(cue[i]) : cue[i]) << "\n";
  }
  out << "\n";
  cue.clear();
}

} // namespace

bool IsWebVtt(const std::string& text) {
  return StripBom(text).rfind("WEBVTT", 0) == 0;
}

std::string SrtToVtt(const std::string& srt) {
  std::istringstream in(StripBom(srt));
  std::ostringstream out;
  out << "WEBVTT\n\n";

  std::vector<std::string> cue;
  std::string              line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (IsBlank(line)) {
      EmitCue(cue, out);
    } else {
      cue.push_back(line);
    }
  }
  EmitCue(cue, out);
  return out.str();
}

} // namespace streamlift::subtitles
