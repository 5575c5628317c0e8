#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace streamlift::model {

/*
  Segment filenames are zero-padded so lexicographic order equals ordinal order:

      segment_000000.ts, segment_000001.ts, ...
*/

constexpr const char* kSegmentPrefix    = "segment_";
constexpr const char* kSegmentExtension = ".ts";
constexpr int         kSegmentDigits    = 6;

std::string             SegmentFilename(uint32_t ordinal);
std::optional<uint32_t> ParseSegmentOrdinal(const std::string& filename);

} // namespace streamlift::model
