#pragma once

#include <arrow/buffer.h>

#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "internal/storage/audio_store.hpp"

namespace waveq::storage {

/*
  In-memory audio store.

  Reads are zero-copy: callers share the stored buffer.

  Thread safety:
    - shared reads
    - exclusive writes
*/
class RamAudioStore final : public AudioStore {
 public:
  RamAudioStore()           = default;
  ~RamAudioStore() override = default;

  std::shared_ptr<arrow::Buffer> Get(const std::string& key) override;
  void                           Put(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer) override;
  void                           Delete(const std::string& key) override;
  bool                           Contains(const std::string& key) override;

 private:
  mutable std::shared_mutex                                        mutex_;
  std::unordered_map<std::string, std::shared_ptr<arrow::Buffer>> buffers_;
};

} // namespace waveq::storage
