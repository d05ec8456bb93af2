#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace waveq::storage::common {

inline void ValidateKey(const std::string& key) {
  if (key.empty()) {
    throw std::invalid_argument("audio key must not be empty");
  }
  for (char c : key) {
    if (c == '/' || c == '\\' || c == '\0') {
      throw std::invalid_argument("audio key contains invalid character");
    }
  }
  if (key == "." || key == "..") {
    throw std::invalid_argument("audio key must not be a relative path component");
  }
}

inline std::filesystem::path KeyPath(const std::filesystem::path& root, const std::string& key) {
  ValidateKey(key);
  return root / (key + ".bin");
}

} // namespace waveq::storage::common
