#include "storage_factory.hpp"

#include <filesystem>

#include "disk/disk_audio_store.hpp"
#include "ram/ram_audio_store.hpp"

namespace waveq::storage {

AudioStorePtr StorageFactory::Build(const waveq::runtime::config::StorageConfig& cfg) {
  if (cfg.has_disk()) {
    std::filesystem::path root = cfg.disk().root_path().empty() ? std::filesystem::path{"/tmp/waveq-engine"} : std::filesystem::path{cfg.disk().root_path()};
    return std::make_shared<DiskAudioStore>(std::move(root), cfg.disk().fsync());
  }

  return std::make_shared<RamAudioStore>();
}

} // namespace waveq::storage
