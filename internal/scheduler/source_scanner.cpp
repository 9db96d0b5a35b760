#include "source_scanner.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>

#include "internal/codec/media_sniffer.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/content_hash.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace ledcast::scheduler {

using observability::StringField;

namespace {

std::string Lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

std::string NormalizeExtension(const std::string& extension) {
  auto lowered = Lower(extension);
  if (!lowered.empty() && lowered.front() == '.') lowered.erase(0, 1);
  return lowered;
}

ledcast::v1::MediaKind GuessKind(const std::filesystem::path& path) {
  try {
    const auto sniffed = codec::Sniff(path);
    if (sniffed.is_video) return ledcast::v1::MEDIA_KIND_VIDEO;
    if (sniffed.container == codec::Container::kGif || sniffed.container == codec::Container::kWebp) {
      return ledcast::v1::MEDIA_KIND_ANIMATED_IMAGE;
    }
    return ledcast::v1::MEDIA_KIND_STATIC_IMAGE;
  } catch (const util::DecodeError& e) {
    // still registered, so the listing can show why conversion fails
    LEDCAST_LOG_DEBUG("source not recognised", {StringField("path", path.string()), StringField("reason", e.what())});
    return ledcast::v1::MEDIA_KIND_UNSPECIFIED;
  }
}

} // namespace

SourceScanner::SourceScanner(std::filesystem::path source_dir, const std::vector<std::string>& extensions) : source_dir_(std::move(source_dir)) {
  for (const auto& extension : extensions) {
    extensions_.insert(NormalizeExtension(extension));
  }
}

bool SourceScanner::Accepts(const std::filesystem::path& path) const {
  const auto name = path.filename().string();
  if (name.empty() || name.front() == '.') return false;
  return extensions_.contains(NormalizeExtension(path.extension().string()));
}

std::vector<ScannedSource> SourceScanner::Scan() {
  std::error_code ec;
  if (!std::filesystem::is_directory(source_dir_, ec)) {
    throw std::runtime_error("source directory is not readable: " + source_dir_.string());
  }

  std::vector<ScannedSource>         found;
  std::lock_guard                    lock(mutex_);
  std::map<std::string, Fingerprint> next_memo;

  for (const auto& entry : std::filesystem::directory_iterator(source_dir_)) {
    if (!entry.is_regular_file() || !Accepts(entry.path())) continue;

    std::error_code size_ec;
    std::error_code time_ec;
    const auto      key        = entry.path().string();
    const auto      file_size  = entry.file_size(size_ec);
    const auto      write_time = entry.last_write_time(time_ec);
    if (size_ec || time_ec) continue;
    const auto size     = static_cast<uint64_t>(file_size);
    const auto mtime_ns = static_cast<int64_t>(write_time.time_since_epoch().count());

    Fingerprint fingerprint;
    if (auto it = memo_.find(key); it != memo_.end() && it->second.size == size && it->second.mtime_ns == mtime_ns) {
      fingerprint = it->second;
    } else {
      try {
        fingerprint = Fingerprint{size, mtime_ns, util::Sha256HexOfFile(entry.path()), GuessKind(entry.path())};
      } catch (const std::exception& e) {
        // vanished or still being written; next scan retries
        LEDCAST_LOG_WARN("cannot hash source", {StringField("path", key), StringField("error", e.what())});
        continue;
      }
    }
    next_memo[key] = fingerprint;

    ScannedSource scanned;
    scanned.path                  = entry.path();
    scanned.record.id             = fingerprint.source_id;
    scanned.record.filename       = entry.path().filename().string();
    scanned.record.display_name   = entry.path().stem().string();
    scanned.record.kind           = fingerprint.kind;
    scanned.record.byte_size      = size;
    scanned.record.ingested_at_ms = util::NowMs();
    found.push_back(std::move(scanned));
  }

  memo_ = std::move(next_memo);

  std::sort(found.begin(), found.end(), [](const ScannedSource& a, const ScannedSource& b) { return a.path < b.path; });
  return found;
}

} // namespace ledcast::scheduler
