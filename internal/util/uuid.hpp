#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace streamlift::util {

/*
  UUID helpers

  Queue message ids and receipt handles are random RFC4122 v4 UUIDs.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

inline std::string NewId() {
  return ToString(GenerateUUID());
}

} // namespace streamlift::util
