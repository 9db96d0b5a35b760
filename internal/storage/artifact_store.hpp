#pragma once

#include <arrow/buffer.h>

#include <memory>
#include <string>
#include <vector>

namespace ledcast::storage {

/*
  Byte storage for serialized artifacts.

  Every artifact is represented as an Arrow Buffer addressed by a path
  relative to the store root ("<geometry>/<file>"). Metadata lives in the
  repository; this layer only moves bytes.
*/

class ArtifactStore {
 public:
  virtual ~ArtifactStore() = default;

  // ------------------------------------------------------------------
  // Read
  // ------------------------------------------------------------------
  /*
    Read an entire artifact. Throws if the file is missing or unreadable.
  */
  virtual std::shared_ptr<arrow::Buffer> Read(const std::string& relative_path) = 0;

  // ------------------------------------------------------------------
  // Write
  // ------------------------------------------------------------------
  /*
    Persist a buffer. The file appears complete or not at all.
  */
  virtual void Write(const std::string& relative_path, const std::shared_ptr<arrow::Buffer>& buffer, bool fsync) = 0;

  // ------------------------------------------------------------------
  // Delete
  // ------------------------------------------------------------------
  /*
    Remove bytes. Missing files are not an error.
  */
  virtual void Remove(const std::string& relative_path) = 0;

  virtual bool Exists(const std::string& relative_path) = 0;

  // Every artifact-area file, including interrupted temporaries.
  virtual std::vector<std::string> ListFiles() = 0;
};

using ArtifactStorePtr = std::shared_ptr<ArtifactStore>;

} // namespace ledcast::storage
