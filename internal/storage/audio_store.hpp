#pragma once

#include <arrow/buffer.h>

#include <memory>
#include <string>

namespace waveq::storage {

/*
  Blob store for encoded audio.

  Keys are opaque references handed to clients (source_ref, result_ref).
  Every blob is represented as an Arrow Buffer; callers never touch raw
  pointers.

  Implementations:
    RAM  -> in-memory Arrow buffers
    DISK -> Arrow file IO, atomic replace
*/
class AudioStore {
 public:
  virtual ~AudioStore() = default;

  // throws util::NotFound
  virtual std::shared_ptr<arrow::Buffer> Get(const std::string& key) = 0;

  virtual void Put(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer) = 0;

  // Missing keys are ignored.
  virtual void Delete(const std::string& key) = 0;

  virtual bool Contains(const std::string& key) = 0;
};

using AudioStorePtr = std::shared_ptr<AudioStore>;

} // namespace waveq::storage
