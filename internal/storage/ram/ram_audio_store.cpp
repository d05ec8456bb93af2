#include "ram_audio_store.hpp"

#include "internal/util/errors.hpp"

namespace waveq::storage {

std::shared_ptr<arrow::Buffer> RamAudioStore::Get(const std::string& key) {
  std::shared_lock lock(mutex_);

  auto it = buffers_.find(key);
  if (it == buffers_.end()) throw util::NotFound("audio " + key + " not found");

  return it->second;
}

void RamAudioStore::Put(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer) {
  std::unique_lock lock(mutex_);
  buffers_[key] = buffer;
}

void RamAudioStore::Delete(const std::string& key) {
  std::unique_lock lock(mutex_);
  buffers_.erase(key);
}

bool RamAudioStore::Contains(const std::string& key) {
  std::shared_lock lock(mutex_);
  return buffers_.contains(key);
}

} // namespace waveq::storage
