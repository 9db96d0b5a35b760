#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

#include "internal/db/model/source_record.hpp"

namespace ledcast::scheduler {

struct ScannedSource {
  std::filesystem::path   path;
  db::model::SourceRecord record;
};

/*
  Lists accepted media files in the watched directory and computes their
  content identity.

  Hashes are memoized on (path, size, mtime) so an idle directory costs
  one stat per file per scan.
*/
class SourceScanner {
 public:
  SourceScanner(std::filesystem::path source_dir, const std::vector<std::string>& extensions);

  std::vector<ScannedSource> Scan();

  bool Accepts(const std::filesystem::path& path) const;

  const std::filesystem::path& SourceDir() const {
    return source_dir_;
  }

 private:
  struct Fingerprint {
    uint64_t               size     = 0;
    int64_t                mtime_ns = 0;
    std::string            source_id;
    ledcast::v1::MediaKind kind = ledcast::v1::MEDIA_KIND_UNSPECIFIED;
  };

  std::filesystem::path           source_dir_;
  std::unordered_set<std::string> extensions_;

  std::mutex                         mutex_;
  std::map<std::string, Fingerprint> memo_;
};

} // namespace ledcast::scheduler
