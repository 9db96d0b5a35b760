#include "disk_artifact_store.hpp"

#include <arrow/io/file.h>

#include <filesystem>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"

namespace ledcast::storage {

using namespace ledcast::storage::common;

DiskArtifactStore::DiskArtifactStore(std::filesystem::path root)
    : root_(std::move(root)) {

  std::filesystem::create_directories(root_);
}

/*
  Read entire artifact from disk.
*/
std::shared_ptr<arrow::Buffer>
DiskArtifactStore::Read(const std::string& relative_path) {

  auto path = ResolveArtifactPath(root_, relative_path);

  auto file = Unwrap(arrow::io::ReadableFile::Open(path.string()), relative_path);
  return ReadAll(file, relative_path);
}

/*
  Atomic write:
      write tmp → flush → rename
*/
void DiskArtifactStore::Write(const std::string& relative_path,
                              const std::shared_ptr<arrow::Buffer>& buffer,
                              bool fsync) {

  auto final_path = ResolveArtifactPath(root_, relative_path);
  auto tmp_path   = final_path.string() + kTempSuffix;

  std::filesystem::create_directories(final_path.parent_path());

  {
    auto out = Unwrap(arrow::io::FileOutputStream::Open(tmp_path), relative_path);
    Unwrap(out->Write(buffer->data(), buffer->size()), relative_path);

    if (fsync)
      Unwrap(out->Flush(), relative_path);

    Unwrap(out->Close(), relative_path);
  }

  std::filesystem::rename(tmp_path, final_path);
}

/*
  Remove artifact from disk
*/
void DiskArtifactStore::Remove(const std::string& relative_path) {
  std::filesystem::remove(ResolveArtifactPath(root_, relative_path));
}

bool DiskArtifactStore::Exists(const std::string& relative_path) {
  std::error_code ec;
  return std::filesystem::is_regular_file(ResolveArtifactPath(root_, relative_path), ec);
}

std::vector<std::string> DiskArtifactStore::ListFiles() {
  std::vector<std::string> files;
  for (const auto& dir : std::filesystem::directory_iterator(root_)) {
    if (!dir.is_directory()) continue;
    const auto geometry = dir.path().filename().string();
    for (const auto& entry : std::filesystem::directory_iterator(dir.path())) {
      if (!entry.is_regular_file()) continue;
      files.push_back(geometry + "/" + entry.path().filename().string());
    }
  }
  return files;
}

} // namespace ledcast::storage
