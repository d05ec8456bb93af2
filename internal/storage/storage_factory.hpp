#pragma once

#include "audio_store.hpp"
#include "config/config.pb.h"

namespace waveq::storage {

/*
  Builds the audio store selected by configuration (ram when unset).
*/
class StorageFactory {
 public:
  static AudioStorePtr Build(const waveq::runtime::config::StorageConfig& cfg);
};

} // namespace waveq::storage
