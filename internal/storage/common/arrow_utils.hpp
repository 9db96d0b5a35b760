#pragma once

#include <arrow/buffer.h>
#include <arrow/io/file.h>
#include <arrow/result.h>

#include <memory>
#include <stdexcept>
#include <string>

namespace ledcast::storage::common {

/*
  Arrow status to exception, prefixed with the artifact path.
*/
template <typename T>
T Unwrap(arrow::Result<T> result, const std::string& path) {
  if (!result.ok()) throw std::runtime_error(path + ": " + result.status().ToString());
  return std::move(result).ValueUnsafe();
}

inline void Unwrap(const arrow::Status& status, const std::string& path) {
  if (!status.ok()) throw std::runtime_error(path + ": " + status.ToString());
}

// Whole-file read; a short read is an error, never a truncated buffer.
inline std::shared_ptr<arrow::Buffer> ReadAll(const std::shared_ptr<arrow::io::RandomAccessFile>& file, const std::string& path) {
  const auto size   = Unwrap(file->GetSize(), path);
  auto       buffer = Unwrap(file->Read(size), path);
  if (buffer->size() != size) {
    throw std::runtime_error(path + ": short read, " + std::to_string(buffer->size()) + " of " + std::to_string(size) + " bytes");
  }
  return buffer;
}

} // namespace ledcast::storage::common
