#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace artifact::util {

/*
  UUID helpers

  Job identifiers are random RFC4122 version 4 UUIDs in canonical text form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

inline std::string GenerateUUIDString() {
  return ToString(GenerateUUID());
}

} // namespace artifact::util
