#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace syncore::util {

/*
  Random identifiers for operations, conflicts and sync sessions.

  Canonical 36-char RFC4122 v4 form, drawn from the OpenSSL CSPRNG so ids
  generated on different devices do not collide.
*/

using UUID = std::array<uint8_t, 16>;

UUID        GenerateUUID();
std::string ToString(const UUID& id);

inline std::string NewId() {
  return ToString(GenerateUUID());
}

} // namespace syncore::util
