#include "ffmpeg_decoder.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <optional>
#include <string>
#include <vector>

#include "internal/codec/media_sniffer.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/subprocess.hpp"

namespace ledcast::codec {
namespace {

using google::protobuf::Struct;
using google::protobuf::Value;

constexpr std::size_t kQueryOutputLimit = 16 * 1024 * 1024;

struct MediaDims {
  uint32_t width  = 0;
  uint32_t height = 0;
};

util::ProcessResult Run(const std::vector<std::string>& argv, std::size_t limit) {
  util::ProcessResult result;
  try {
    result = util::RunProcess(argv, limit);
  } catch (const std::exception& e) {
    throw util::DecodeError(argv[0] + " failed: " + e.what());
  }

  if (result.exit_code == util::kExecFailedExitCode && result.stderr_tail.empty()) {
    throw util::DecodeError("cannot execute " + argv[0]);
  }
  if (result.exit_code != 0) {
    auto reason = result.stderr_tail;
    reason.erase(std::remove(reason.begin(), reason.end(), '\n'), reason.end());
    throw util::DecodeError(argv[0] + " exited with " + std::to_string(result.exit_code) + (reason.empty() ? "" : ": " + reason));
  }
  return result;
}

Struct ParseJson(const std::string& json, const std::string& what) {
  Struct out;
  auto   status = google::protobuf::util::JsonStringToMessage(json, &out);
  if (!status.ok()) {
    throw util::DecodeError("unparsable " + what + " output: " + std::string(status.message()));
  }
  return out;
}

std::optional<double> NumberField(const Struct& object, const std::string& key) {
  auto it = object.fields().find(key);
  if (it == object.fields().end()) {
    return std::nullopt;
  }
  const Value& value = it->second;
  if (value.kind_case() == Value::kNumberValue) {
    return value.number_value();
  }
  if (value.kind_case() == Value::kStringValue) {
    char*        end    = nullptr;
    const auto&  text   = value.string_value();
    const double parsed = std::strtod(text.c_str(), &end);
    if (end && end != text.c_str() && *end == '\0') {
      return parsed;
    }
  }
  return std::nullopt;
}

const Struct* FirstEntry(const Struct& root, const std::string& key) {
  auto it = root.fields().find(key);
  if (it == root.fields().end() || it->second.kind_case() != Value::kListValue) {
    return nullptr;
  }
  const auto& values = it->second.list_value().values();
  if (values.empty() || values.Get(0).kind_case() != Value::kStructValue) {
    return nullptr;
  }
  return &values.Get(0).struct_value();
}

MediaDims QueryStream(const FfmpegOptions& options, const std::filesystem::path& path) {
  auto result = Run({options.ffprobe_path, "-v", "error", "-select_streams", "v:0", "-show_entries", "stream=width,height", "-of", "json",
                     path.string()},
                    kQueryOutputLimit);

  const Struct  root   = ParseJson(result.stdout_data, "ffprobe");
  const Struct* stream = FirstEntry(root, "streams");
  if (!stream) {
    throw util::DecodeError("no video stream");
  }

  MediaDims info;
  info.width  = static_cast<uint32_t>(NumberField(*stream, "width").value_or(0));
  info.height = static_cast<uint32_t>(NumberField(*stream, "height").value_or(0));
  if (info.width == 0 || info.height == 0) {
    throw util::DecodeError("stream reports zero dimensions");
  }
  return info;
}

// Per-frame display durations of an animated image, empty when unknown.
std::vector<uint32_t> QueryFrameDurations(const FfmpegOptions& options, const std::filesystem::path& path) {
  auto result = Run({options.ffprobe_path, "-v", "error", "-select_streams", "v:0", "-show_entries", "frame=duration_time,pkt_duration_time", "-of",
                     "json", path.string()},
                    kQueryOutputLimit);

  const Struct root = ParseJson(result.stdout_data, "ffprobe");
  auto         it   = root.fields().find("frames");
  if (it == root.fields().end() || it->second.kind_case() != Value::kListValue) {
    return {};
  }

  std::vector<uint32_t> durations;
  for (const auto& entry : it->second.list_value().values()) {
    if (entry.kind_case() != Value::kStructValue) {
      return {};
    }
    auto seconds = NumberField(entry.struct_value(), "duration_time");
    if (!seconds) {
      seconds = NumberField(entry.struct_value(), "pkt_duration_time");
    }
    if (!seconds) {
      return {};
    }
    durations.push_back(static_cast<uint32_t>(std::lround(*seconds * 1000.0)));
  }
  return durations;
}

MediaDims BoundedSize(const MediaDims& native, uint32_t max_dimension) {
  const uint32_t longest = std::max(native.width, native.height);
  if (max_dimension == 0 || longest <= max_dimension) {
    return native;
  }
  const double scale = static_cast<double>(max_dimension) / longest;
  MediaDims    bounded;
  bounded.width  = std::max<uint32_t>(1, static_cast<uint32_t>(std::lround(native.width * scale)));
  bounded.height = std::max<uint32_t>(1, static_cast<uint32_t>(std::lround(native.height * scale)));
  return bounded;
}

} // namespace

FfmpegDecoder::FfmpegDecoder(FfmpegOptions options) : options_(std::move(options)) {
}

DecodedMedia FfmpegDecoder::Decode(const std::filesystem::path& path) {
  const SniffResult sniff  = Sniff(path);
  const MediaDims   native = QueryStream(options_, path);
  const MediaDims   size   = BoundedSize(native, options_.codec.max_decode_dimension);

  const bool still_container = sniff.container == Container::kPng || sniff.container == Container::kJpeg || sniff.container == Container::kBmp;
  const uint32_t max_frames  = still_container ? 1 : std::max<uint32_t>(1, options_.codec.max_frames);

  std::string filter = "scale=" + std::to_string(size.width) + ":" + std::to_string(size.height) + ":flags=area";
  if (sniff.is_video) {
    filter = "fps=" + std::to_string(std::max<uint32_t>(1, options_.codec.video_fps)) + "," + filter;
  }

  std::vector<std::string> argv = {options_.ffmpeg_path, "-v", "error", "-nostdin", "-i", path.string()};
  if (!sniff.is_video) {
    argv.insert(argv.end(), {"-vsync", "0"});
  }
  argv.insert(argv.end(), {"-vf", filter, "-frames:v", std::to_string(max_frames), "-f", "rawvideo", "-pix_fmt", "rgb24", "-"});

  const std::size_t frame_bytes = static_cast<std::size_t>(size.width) * size.height * 3;
  auto              result      = Run(argv, frame_bytes * max_frames + frame_bytes);

  const auto& pixels = result.stdout_data;
  if (pixels.empty()) {
    throw util::DecodeError("decoder produced no frames");
  }
  if (pixels.size() % frame_bytes != 0) {
    throw util::DecodeError("short pixel read: " + std::to_string(pixels.size()) + " bytes is not a whole number of frames");
  }

  DecodedMedia media;
  media.width  = size.width;
  media.height = size.height;
  media.loop   = sniff.loops;

  const std::size_t count = pixels.size() / frame_bytes;
  media.frames.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    const auto* begin = reinterpret_cast<const uint8_t*>(pixels.data()) + i * frame_bytes;
    media.frames.emplace_back(begin, begin + frame_bytes);
  }

  if (sniff.is_video) {
    media.kind = ledcast::v1::MEDIA_KIND_VIDEO;
    media.durations_ms.assign(count, 1000 / std::max<uint32_t>(1, options_.codec.video_fps));
  } else if (count > 1) {
    media.kind      = ledcast::v1::MEDIA_KIND_ANIMATED_IMAGE;
    auto durations  = QueryFrameDurations(options_, path);
    if (durations.size() >= count) {
      durations.resize(count);
      media.durations_ms = std::move(durations);
    }
  } else {
    media.kind = ledcast::v1::MEDIA_KIND_STATIC_IMAGE;
    media.loop = true;
  }

  LEDCAST_LOG_INFO("Decoded media", {observability::StringField("file", path.filename().string()),
                                     observability::StringField("container", ToString(sniff.container)), observability::IntField("frames", count),
                                     observability::IntField("width", media.width), observability::IntField("height", media.height)});
  return media;
}

} // namespace ledcast::codec
