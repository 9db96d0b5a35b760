#pragma once

#include <unistd.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/cache/cache_store.hpp"
#include "internal/codec/media_decoder.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/model/frame_sequence.hpp"
#include "internal/storage/disk/disk_artifact_store.hpp"
#include "internal/util/content_hash.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace ledcast::testing {

inline constexpr const char* kTestEncoderVersion = "test-encoder-1";

// Fresh, empty directory unique to this process.
inline std::filesystem::path MakeTempDir(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / "ledcast_tests" / (name + "-" + std::to_string(::getpid()));
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

inline void WriteFile(const std::filesystem::path& path, const std::string& content) {
  std::filesystem::create_directories(path.parent_path());
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << content;
}

inline model::FrameSequence MakeSequence(const model::TargetGeometry& geometry, std::size_t frames, uint32_t duration_ms = 40, bool loop = true,
                                         uint8_t seed = 1) {
  model::FrameSequence sequence;
  sequence.geometry = geometry;
  sequence.loop     = loop;
  for (std::size_t i = 0; i < frames; ++i) {
    sequence.frames.emplace_back(geometry.FrameBytes(), static_cast<uint8_t>(seed + i));
    sequence.durations_ms.push_back(duration_ms);
  }
  return sequence;
}

inline db::model::SourceRecord MakeSource(const std::string& content, const std::string& filename) {
  db::model::SourceRecord source;
  source.id             = util::Sha256Hex(content);
  source.filename       = filename;
  source.display_name   = std::filesystem::path(filename).stem().string();
  source.kind           = ledcast::v1::MEDIA_KIND_ANIMATED_IMAGE;
  source.byte_size      = content.size();
  source.ingested_at_ms = util::NowMs();
  return source;
}

inline std::shared_ptr<cache::CacheStore> MakeCache(const std::filesystem::path& root, cache::CacheOptions options = {},
                                                    std::shared_ptr<db::Repository> repository = nullptr) {
  if (!repository) {
    repository = std::make_shared<db::memory::MemoryRepository>();
  }
  options.fsync = false;
  return std::make_shared<cache::CacheStore>(std::move(repository), std::make_shared<storage::DiskArtifactStore>(root), kTestEncoderVersion,
                                             options);
}

/*
  Decoder double: returns a canned animation, or fails for files whose
  name contains "broken".
*/
class FakeDecoder final : public codec::MediaDecoder {
 public:
  codec::DecodedMedia Decode(const std::filesystem::path& path) override {
    ++calls;
    if (path.filename().string().find("broken") != std::string::npos) {
      throw util::DecodeError("not a media file: " + path.filename().string());
    }

    codec::DecodedMedia media;
    media.kind   = ledcast::v1::MEDIA_KIND_ANIMATED_IMAGE;
    media.width  = 8;
    media.height = 8;
    media.loop   = true;
    for (uint8_t i = 0; i < frames; ++i) {
      media.frames.emplace_back(8 * 8 * 3, static_cast<uint8_t>(40 * (i + 1)));
      media.durations_ms.push_back(50);
    }
    return media;
  }

  std::atomic<int> calls{0};
  uint8_t          frames = 3;
};

} // namespace ledcast::testing
