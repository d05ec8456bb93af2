#pragma once

#include <arrow/buffer.h>

#include <filesystem>

#include "internal/storage/audio_store.hpp"

namespace waveq::storage {

/*
  Durable disk storage using Arrow IO.

  Properties:
    - atomic replace writes
    - optional fsync
*/
class DiskAudioStore final : public AudioStore {
 public:
  DiskAudioStore(std::filesystem::path root, bool fsync);

  std::shared_ptr<arrow::Buffer> Get(const std::string& key) override;
  void                           Put(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer) override;
  void                           Delete(const std::string& key) override;
  bool                           Contains(const std::string& key) override;

 private:
  std::filesystem::path root_;
  bool                  fsync_;
};

} // namespace waveq::storage
