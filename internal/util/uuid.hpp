#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace mc3d::util {

/*
  UUID helpers

  Store rows are keyed by random RFC4122 version 4 UUIDs.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

// GenerateUUID() in canonical text form.
std::string NewUuidString();

} // namespace mc3d::util
