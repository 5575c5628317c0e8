#pragma once

#include <optional>
#include <string>

namespace streamlift::catalog {

/*
  Finds the source file for a media id: a regular file anywhere under
  library_root whose stem equals the id and whose extension is supported.
  When several match, the lexicographically smallest path wins.
*/
class MediaLocator {
 public:
  explicit MediaLocator(std::string library_root);

  std::optional<std::string> Locate(const std::string& media_id) const;

 private:
  std::string library_root_;
};

} // namespace streamlift::catalog
