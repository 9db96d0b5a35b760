#pragma once

#include <arrow/buffer.h>

#include <filesystem>

#include "internal/storage/artifact_store.hpp"

namespace ledcast::storage {

/*
  Durable disk storage using Arrow IO.

  Properties:
    - atomic replace writes (tmp -> flush -> rename)
    - one subdirectory per geometry
    - files at the root (the metadata database) are never listed
*/

class DiskArtifactStore final : public ArtifactStore {
public:
  explicit DiskArtifactStore(std::filesystem::path root);

  std::shared_ptr<arrow::Buffer> Read(const std::string& relative_path) override;

  void Write(const std::string& relative_path,
             const std::shared_ptr<arrow::Buffer>& buffer,
             bool fsync) override;

  void Remove(const std::string& relative_path) override;

  bool Exists(const std::string& relative_path) override;

  std::vector<std::string> ListFiles() override;

  const std::filesystem::path& Root() const { return root_; }

private:
  std::filesystem::path root_;
};

} // namespace ledcast::storage
