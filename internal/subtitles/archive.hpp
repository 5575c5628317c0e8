#pragma once

#include <string>

#include "internal/util/cancellation.hpp"

namespace streamlift::subtitles {

// Local file header magic "PK\x03\x04".
bool IsZipArchive(const std::string& bytes);

/*
  Unpacks a zip held in memory into work_dir with the unzip tool and returns
  the contents of the first .srt or .vtt member. Throws util::InputError when
  the archive holds no subtitle file.
*/
std::string ExtractSubtitleFromZip(const std::string& bytes, const std::string& work_dir, const std::string& unzip_path,
                                   const util::CancellationToken& cancel);

} // namespace streamlift::subtitles
