#pragma once

#include <arrow/buffer.h>
#include <arrow/io/file.h>
#include <arrow/result.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

namespace waveq::storage::common {

/*
  Unwrap an Arrow Result<T> / Status or throw std::runtime_error. The context
  names the audio key or file being touched so failures are attributable.
*/
template <typename T>
T Unwrap(arrow::Result<T> result, std::string_view context) {
  if (!result.ok()) throw std::runtime_error(std::string(context) + ": " + result.status().ToString());
  return std::move(result).ValueOrDie();
}

inline void Unwrap(const arrow::Status& status, std::string_view context) {
  if (!status.ok()) throw std::runtime_error(std::string(context) + ": " + status.ToString());
}

inline std::shared_ptr<arrow::Buffer> ReadAll(const std::shared_ptr<arrow::io::RandomAccessFile>& file, std::string_view context) {
  auto size = Unwrap(file->GetSize(), context);
  return Unwrap(file->ReadAt(0, size), context);
}

// Upload bodies and fetched results cross the gRPC boundary as std::string.
inline std::shared_ptr<arrow::Buffer> CopyToBuffer(std::string bytes) {
  return arrow::Buffer::FromString(std::move(bytes));
}

inline std::string BufferToString(const arrow::Buffer& buffer) {
  return buffer.ToString();
}

} // namespace waveq::storage::common
