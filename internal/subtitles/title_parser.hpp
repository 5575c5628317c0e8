#pragma once

#include <optional>
#include <string>

namespace streamlift::subtitles {

struct ParsedTitle {
  std::string        title;
  std::optional<int> year;
};

/*
  "The.Matrix.1999.1080p.BluRay" → {"The Matrix", 1999}

  '.' and '_' separate words. The first 19xx/20xx word after at least one
  title word is the year and ends the title; without one the whole stem is
  the title.
*/
ParsedTitle ParseTitle(const std::string& file_stem);

} // namespace streamlift::subtitles
