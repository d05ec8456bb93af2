#include "disk_audio_store.hpp"

#include <arrow/io/file.h>

#include <stdexcept>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace waveq::storage {

using namespace waveq::storage::common;

DiskAudioStore::DiskAudioStore(std::filesystem::path root, bool fsync) : root_(std::move(root)), fsync_(fsync) {
  std::filesystem::create_directories(root_);
}

std::shared_ptr<arrow::Buffer> DiskAudioStore::Get(const std::string& key) {
  auto path = KeyPath(root_, key);
  if (!std::filesystem::exists(path)) {
    throw util::NotFound("audio " + key + " not found");
  }

  const auto context = "read audio " + key;
  std::shared_ptr<arrow::io::RandomAccessFile> file = Unwrap(arrow::io::ReadableFile::Open(path.string()), context);
  auto buffer = ReadAll(file, context);
  Unwrap(file->Close(), context);
  return buffer;
}

/*
  Atomic write:
      write tmp -> flush -> rename
  Readers never observe a partially written result.
*/
void DiskAudioStore::Put(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer) {
  if (!buffer) throw std::invalid_argument("audio " + key + ": null buffer");

  auto       final_path = KeyPath(root_, key);
  auto       tmp_path   = final_path.string() + ".tmp";
  const auto context    = "write audio " + key;

  {
    auto out = Unwrap(arrow::io::FileOutputStream::Open(tmp_path), context);
    Unwrap(out->Write(buffer->data(), buffer->size()), context);

    if (fsync_) Unwrap(out->Flush(), context);

    Unwrap(out->Close(), context);
  }

  std::filesystem::rename(tmp_path, final_path);
}

void DiskAudioStore::Delete(const std::string& key) {
  std::filesystem::remove(KeyPath(root_, key));
}

bool DiskAudioStore::Contains(const std::string& key) {
  return std::filesystem::exists(KeyPath(root_, key));
}

} // namespace waveq::storage
