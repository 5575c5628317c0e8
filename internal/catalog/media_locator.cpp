#include "media_locator.hpp"

#include <filesystem>

#include "internal/observability/logging.hpp"
#include "internal/transcode/codec_plan.hpp"

namespace streamlift::catalog {

namespace fs = std::filesystem;

using streamlift::observability::StringField;

MediaLocator::MediaLocator(std::string library_root) : library_root_(std::move(library_root)) {
}

std::optional<std::string> MediaLocator::Locate(const std::string& media_id) const {
  if (library_root_.empty() || media_id.empty()) return std::nullopt;

  std::optional<std::string> best;
  std::error_code            ec;
  fs::recursive_directory_iterator it(library_root_, fs::directory_options::skip_permission_denied, ec);
  for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
    std::error_code type_ec;
    if (!it->is_regular_file(type_ec)) continue;

    const auto& path = it->path();
    if (path.stem().string() != media_id || !transcode::IsSupportedSource(path.string())) continue;
    if (!best || path.string() < *best) best = path.string();
  }
  if (ec) {
    STREAMLIFT_LOG_WARN("Library scan incomplete", {StringField("library_root", library_root_), StringField("error", ec.message())});
  }
  return best;
}

} // namespace streamlift::catalog
