#include "archive.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>

#include "internal/util/errors.hpp"
#include "internal/util/subprocess.hpp"

namespace streamlift::subtitles {

namespace fs = std::filesystem;

bool IsZipArchive(const std::string& bytes) {
  return bytes.size() >= 4 && bytes.compare(0, 4, std::string("PK\x03\x04", 4)) == 0;
}

std::string ExtractSubtitleFromZip(const std::string& bytes, const std::string& work_dir, const std::string& unzip_path,
                                   const util::CancellationToken& cancel) {
  std::error_code ec;
  fs::create_directories(work_dir, ec);
  if (ec) {
    throw util::TransientIoError("cannot create " + work_dir + ": " + ec.message());
  }

  const auto archive = (fs::path(work_dir) / "archive.zip").string();
  {
    std::ofstream out(archive, std::ios::binary | std::ios::trunc);
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    if (!out) throw util::TransientIoError("cannot write " + archive);
  }

  const auto members = (fs::path(work_dir) / "members").string();
  auto result = util::RunProcess({unzip_path.empty() ? "unzip" : unzip_path, "-o", "-qq", archive, "-d", members}, {}, cancel);
  if (result.exit_code != 0) {
    throw util::InputError("unzip failed (exit " + std::to_string(result.exit_code) + "): " + result.stderr_tail);
  }

  std::vector<fs::path> found;
  for (const auto& entry : fs::recursive_directory_iterator(members, ec)) {
    if (!entry.is_regular_file()) continue;
    auto ext = entry.path().extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (ext == ".srt" || ext == ".vtt") found.push_back(entry.path());
  }
  if (found.empty()) {
    throw util::InputError("archive contains no subtitle file");
  }
  std::sort(found.begin(), found.end());

  std::ifstream      in(found.front(), std::ios::binary);
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

} // namespace streamlift::subtitles
