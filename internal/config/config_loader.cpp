#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <vector>

#include "internal/model/geometry.hpp"
#include "internal/util/errors.hpp"

namespace ledcast::config {

using ledcast::runtime::config::RuntimeConfig;
using ledcast::util::ConfigurationError;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw ConfigurationError("Unsupported YAML node");
  }
}

// ------------------------------------------------------------
// Environment overrides
// ------------------------------------------------------------

namespace {

const char* Env(const char* name) {
  const char* value = std::getenv(name);
  return (value && *value) ? value : nullptr;
}

uint64_t ParseUnsigned(const char* name, const std::string& text) {
  uint64_t value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || ptr != text.data() + text.size()) {
    throw ConfigurationError(std::string(name) + ": expected an unsigned integer, got '" + text + "'");
  }
  return value;
}

std::vector<std::string> SplitList(const std::string& text) {
  std::vector<std::string> out;
  std::stringstream        in(text);
  std::string              item;
  while (std::getline(in, item, ',')) {
    const auto first = item.find_first_not_of(" \t");
    const auto last  = item.find_last_not_of(" \t");
    if (first != std::string::npos) {
      out.push_back(item.substr(first, last - first + 1));
    }
  }
  return out;
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw ConfigurationError("Failed to load YAML config: " + std::string(e.what()));
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw ConfigurationError("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw ConfigurationError("Invalid configuration: " + std::string(status.message()));
  }

  return config;
}

void ConfigLoader::ApplyEnvironmentOverrides(RuntimeConfig& config) {
  if (const char* v = Env("LEDCAST_SOURCE_DIR")) config.mutable_scheduler()->set_source_dir(v);
  if (const char* v = Env("LEDCAST_LOCK_PATH")) config.mutable_scheduler()->set_lock_path(v);
  if (const char* v = Env("LEDCAST_CACHE_ROOT")) config.mutable_cache()->set_root(v);
  if (const char* v = Env("LEDCAST_CACHE_MAX_ARTIFACTS")) config.mutable_cache()->set_max_artifacts(ParseUnsigned("LEDCAST_CACHE_MAX_ARTIFACTS", v));
  if (const char* v = Env("LEDCAST_CACHE_MAX_BYTES")) config.mutable_cache()->set_max_bytes(ParseUnsigned("LEDCAST_CACHE_MAX_BYTES", v));
  if (const char* v = Env("LEDCAST_DB_PATH")) config.mutable_database()->mutable_sqlite()->set_path(v);
  if (const char* v = Env("LEDCAST_ITEMS_PER_PAGE")) {
    config.mutable_catalog()->set_items_per_page(static_cast<uint32_t>(ParseUnsigned("LEDCAST_ITEMS_PER_PAGE", v)));
  }
  if (const char* v = Env("LEDCAST_CATALOG_ADDRESS")) config.mutable_catalog()->set_bind_address(v);
  if (const char* v = Env("LEDCAST_STREAM_PORT")) config.mutable_stream()->set_port(static_cast<uint32_t>(ParseUnsigned("LEDCAST_STREAM_PORT", v)));
  if (const char* v = Env("LEDCAST_FFMPEG")) config.mutable_codec()->set_ffmpeg_path(v);
  if (const char* v = Env("LEDCAST_FFPROBE")) config.mutable_codec()->set_ffprobe_path(v);

  if (const char* v = Env("LEDCAST_GEOMETRIES")) {
    config.clear_geometries();
    for (auto& tag : SplitList(v)) {
      config.add_geometries(tag);
    }
  }
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  if (config.geometries().empty()) {
    for (const char* tag : {"32x32", "53x11", "16x16"}) {
      config.add_geometries(tag);
    }
  }

  const std::filesystem::path cache_root = config.cache().root();

  if (!config.database().has_sqlite() && !config.database().has_memory()) {
    config.mutable_database()->mutable_sqlite();
  }
  if (config.database().has_sqlite()) {
    auto* sqlite = config.mutable_database()->mutable_sqlite();
    if (sqlite->path().empty()) {
      sqlite->set_path((cache_root / "ledcast.sqlite3").string());
    }
    if (sqlite->busy_timeout_ms() == 0) sqlite->set_busy_timeout_ms(5000);
  }

  auto* codec = config.mutable_codec();
  if (codec->ffmpeg_path().empty()) codec->set_ffmpeg_path("ffmpeg");
  if (codec->ffprobe_path().empty()) codec->set_ffprobe_path("ffprobe");
  if (codec->default_frame_ms() == 0) codec->set_default_frame_ms(66);
  if (codec->min_frame_ms() == 0) codec->set_min_frame_ms(20);
  if (codec->video_fps() == 0) codec->set_video_fps(15);
  if (codec->max_frames() == 0) codec->set_max_frames(900);
  if (codec->max_decode_dimension() == 0) codec->set_max_decode_dimension(256);

  auto* scheduler = config.mutable_scheduler();
  if (scheduler->lock_path().empty()) scheduler->set_lock_path((cache_root / "ledcast-scheduler.lock").string());
  if (scheduler->scan_interval_seconds() == 0) scheduler->set_scan_interval_seconds(300);
  if (scheduler->max_attempts() == 0) scheduler->set_max_attempts(3);
  if (scheduler->retry_backoff_ms() == 0) scheduler->set_retry_backoff_ms(2000);
  if (scheduler->lock_retry_ms() == 0) scheduler->set_lock_retry_ms(1000);
  if (scheduler->extensions().empty()) {
    for (const char* ext : {"gif", "png", "jpg", "jpeg", "webp", "bmp", "mp4", "mov", "m4v", "mkv", "webm", "avi"}) {
      scheduler->add_extensions(ext);
    }
  }

  auto* stream = config.mutable_stream();
  if (stream->bind_address().empty()) stream->set_bind_address("0.0.0.0");
  if (stream->port() == 0) stream->set_port(8766);
  if (stream->outbound_queue_frames() == 0) stream->set_outbound_queue_frames(4);
  if (stream->handshake_timeout_ms() == 0) stream->set_handshake_timeout_ms(10000);
  if (stream->send_timeout_ms() == 0) stream->set_send_timeout_ms(5000);
  if (stream->not_ready_retry_ms() == 0) stream->set_not_ready_retry_ms(1000);
  if (stream->pending_wait_timeout_ms() == 0) stream->set_pending_wait_timeout_ms(60000);
  if (stream->rotation_min_ms() == 0) stream->set_rotation_min_ms(30000);
  if (stream->activity_log_size() == 0) stream->set_activity_log_size(256);
  if (stream->max_sessions() == 0) stream->set_max_sessions(64);

  auto* catalog = config.mutable_catalog();
  if (catalog->bind_address().empty()) catalog->set_bind_address("0.0.0.0:50061");
  if (catalog->items_per_page() == 0) catalog->set_items_per_page(20);
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  if (config.scheduler().source_dir().empty()) {
    throw ConfigurationError("scheduler.source_dir is required");
  }
  if (config.cache().root().empty()) {
    throw ConfigurationError("cache.root is required");
  }

  std::vector<std::string> tags(config.geometries().begin(), config.geometries().end());
  if (tags.empty()) {
    throw ConfigurationError("at least one geometry is required");
  }
  (void)model::ParseGeometryTags(tags);

  if (config.stream().port() == 0 || config.stream().port() > 65535) {
    throw ConfigurationError("stream.port must be in 1..65535");
  }
  if (config.codec().video_fps() == 0 || config.codec().video_fps() > 60) {
    throw ConfigurationError("codec.video_fps must be in 1..60");
  }
  if (config.codec().min_frame_ms() > config.codec().default_frame_ms()) {
    throw ConfigurationError("codec.min_frame_ms must not exceed codec.default_frame_ms");
  }
  if (config.scheduler().max_attempts() == 0) {
    throw ConfigurationError("scheduler.max_attempts must be at least 1");
  }
  if (config.stream().outbound_queue_frames() == 0) {
    throw ConfigurationError("stream.outbound_queue_frames must be at least 1");
  }
  if (config.stream().max_sessions() == 0) {
    throw ConfigurationError("stream.max_sessions must be at least 1");
  }
  if (config.catalog().items_per_page() == 0) {
    throw ConfigurationError("catalog.items_per_page must be at least 1");
  }
}

RuntimeConfig ConfigLoader::Load(const std::string& path) {
  auto config = LoadFromYaml(path);
  ApplyEnvironmentOverrides(config);
  ApplyDefaults(config);
  Validate(config);
  return config;
}

} // namespace ledcast::config
