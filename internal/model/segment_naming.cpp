#include "segment_naming.hpp"

#include <cctype>
#include <cstdio>
#include <cstring>

namespace streamlift::model {

std::string SegmentFilename(uint32_t ordinal) {
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%s%06u%s", kSegmentPrefix, ordinal, kSegmentExtension);
  return buffer;
}

std::optional<uint32_t> ParseSegmentOrdinal(const std::string& filename) {
  const size_t prefix_len = std::strlen(kSegmentPrefix);
  const size_t ext_len    = std::strlen(kSegmentExtension);

  if (filename.size() != prefix_len + kSegmentDigits + ext_len) return std::nullopt;
  if (filename.compare(0, prefix_len, kSegmentPrefix) != 0) return std::nullopt;
  if (filename.compare(prefix_len + kSegmentDigits, ext_len, kSegmentExtension) != 0) return std::nullopt;

  uint32_t ordinal = 0;
  for (size_t i = prefix_len; i < prefix_len + kSegmentDigits; ++i) {
    const auto c = static_cast<unsigned char>(filename[i]);
    if (!std::isdigit(c)) return std::nullopt;
    ordinal = ordinal * 10 + static_cast<uint32_t>(c - '0');
  }
  return ordinal;
}

} // namespace streamlift::model
