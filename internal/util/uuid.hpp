#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace waveq::util {

/*
  Audio store keys

  Uploaded sources and pipeline results are stored under "<prefix>-<uuid>"
  where the uuid is a random RFC4122 v4 identifier. Results additionally carry
  the container as an extension ("result-<uuid>.wav").
*/

using UUID = std::array<uint8_t, 16>;

UUID        GenerateUUID();
std::string ToString(const UUID& id);

std::string GenerateRef(const std::string& prefix);
std::string GenerateRef(const std::string& prefix, const std::string& extension);

} // namespace waveq::util
