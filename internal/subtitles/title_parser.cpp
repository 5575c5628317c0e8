#include "title_parser.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <vector>

namespace streamlift::subtitles {

namespace {

std::optional<int> AsYear(std::string word) {
  word.erase(std::remove_if(word.begin(), word.end(), [](char c) { return c == '(' || c == ')' || c == '[' || c == ']'; }), word.end());
  if (word.size() != 4 || !std::all_of(word.begin(), word.end(), [](unsigned char c) { return std::isdigit(c); })) {
    return std::nullopt;
  }
  if (word.compare(0, 2, "19") != 0 && word.compare(0, 2, "20") != 0) return std::nullopt;
  return std::stoi(word);
}

} // namespace

ParsedTitle ParseTitle(const std::string& file_stem) {
  std::string spaced = file_stem;
  std::replace(spaced.begin(), spaced.end(), '.', ' ');
  std::replace(spaced.begin(), spaced.end(), '_', ' ');

  std::istringstream       in(spaced);
  std::vector<std::string> words;
  std::string              word;
  while (in >> word) words.push_back(word);

  ParsedTitle parsed;
  size_t      end = words.size();
  for (size_t i = 1; i < words.size(); ++i) {
    if (auto year = AsYear(words[i])) {
      parsed.year = year;
      end         = i;
      break;
    }
  }

  for (size_t i = 0; i < end; ++i) {
    if (!parsed.title.empty()) parsed.title += " ";
    parsed.title += words[i];
  }
  return parsed;
}

} // namespace streamlift::subtitles
