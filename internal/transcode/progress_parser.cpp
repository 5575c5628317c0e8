#include "progress_parser.hpp"

#include <cstdlib>

namespace streamlift::transcode {

namespace {

std::string FieldValue(const std::string& line, const std::string& key) {
  auto pos = line.find(key);
  if (pos == std::string::npos) return {};
  pos += key.size();
  while (pos < line.size() && line[pos] == ' ') ++pos;
  auto end = line.find_first_of(" ,", pos);
  return line.substr(pos, end == std::string::npos ? std::string::npos : end - pos);
}

bool ParseDouble(const std::string& text, double& out) {
  if (text.empty()) return false;
  char* end = nullptr;
  out       = std::strtod(text.c_str(), &end);
  return end == text.c_str() + text.size();
}

} // namespace

std::optional<double> ParseClock(const std::string& value) {
  auto first  = value.find(':');
  auto second = first == std::string::npos ? std::string::npos : value.find(':', first + 1);
  if (second == std::string::npos) return std::nullopt;

  double hours = 0, minutes = 0, seconds = 0;
  if (!ParseDouble(value.substr(0, first), hours) || !ParseDouble(value.substr(first + 1, second - first - 1), minutes) ||
      !ParseDouble(value.substr(second + 1), seconds)) {
    return std::nullopt;
  }
  if (hours < 0 || minutes < 0 || seconds < 0) return std::nullopt;
  return hours * 3600 + minutes * 60 + seconds;
}

std::optional<TranscodeProgress> ParseProgressLine(const std::string& line) {
  auto time = ParseClock(FieldValue(line, "time="));
  if (!time) return std::nullopt;

  TranscodeProgress progress;
  progress.elapsed_seconds = *time;

  auto speed = FieldValue(line, "speed=");
  if (!speed.empty() && speed.back() == 'x') speed.pop_back();
  double value = 0;
  if (ParseDouble(speed, value) && value > 0) {
    progress.speed = value;
  }
  return progress;
}

} // namespace streamlift::transcode
