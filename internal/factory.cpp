#include "factory.hpp"

#include <filesystem>
#include <string>

#include "internal/cache/cache_store.hpp"
#include "internal/codec/ffmpeg_decoder.hpp"
#include "internal/codec/frame_codec.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/pipeline/conversion_pipeline.hpp"
#include "internal/scheduler/conversion_scheduler.hpp"
#include "internal/service/catalog_service.hpp"
#include "internal/storage/disk/disk_artifact_store.hpp"
#include "internal/stream/stream_server.hpp"
#include "internal/util/errors.hpp"
#if LEDCAST_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace ledcast::factory {

using observability::IntField;
using observability::StringField;
using runtime::config::RuntimeConfig;

namespace {

codec::CodecOptions ToCodecOptions(const runtime::config::CodecConfig& config) {
  codec::CodecOptions options;
  options.default_frame_ms     = config.default_frame_ms();
  options.min_frame_ms         = config.min_frame_ms();
  options.video_fps            = config.video_fps();
  options.max_frames           = config.max_frames();
  options.max_decode_dimension = config.max_decode_dimension();
  return options;
}

stream::StreamServerOptions ToStreamOptions(const runtime::config::StreamConfig& config) {
  stream::StreamServerOptions options;
  options.bind_address      = config.bind_address();
  options.port              = static_cast<uint16_t>(config.port());
  options.max_sessions      = config.max_sessions();
  options.activity_log_size = config.activity_log_size();

  options.session.outbound_queue_frames   = config.outbound_queue_frames();
  options.session.handshake_timeout_ms    = config.handshake_timeout_ms();
  options.session.send_timeout_ms         = config.send_timeout_ms();
  options.session.not_ready_retry_ms      = config.not_ready_retry_ms();
  options.session.pending_wait_timeout_ms = config.pending_wait_timeout_ms();
  options.session.rotation_min_ms         = config.rotation_min_ms();
  return options;
}

scheduler::SchedulerOptions ToSchedulerOptions(const runtime::config::SchedulerConfig& config) {
  scheduler::SchedulerOptions options;
  options.source_dir            = config.source_dir();
  options.lock_path             = config.lock_path();
  options.scan_interval_seconds = config.scan_interval_seconds();
  options.extensions.assign(config.extensions().begin(), config.extensions().end());

  options.worker.max_attempts     = config.max_attempts();
  options.worker.retry_backoff_ms = config.retry_backoff_ms();
  options.worker.lock_retry_ms    = config.lock_retry_ms();
  return options;
}

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if LEDCAST_DB_SQLITE
    const std::filesystem::path path = database.sqlite().path();
    if (path.has_parent_path()) {
      std::filesystem::create_directories(path.parent_path());
    }
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(path.string(), database.sqlite().busy_timeout_ms());
    sqlite_db->BootstrapSchema();
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw util::ConfigurationError("sqlite backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const RuntimeConfig& config) {
  Application app;

  std::vector<std::string> tags(config.geometries().begin(), config.geometries().end());
  app.geometries = model::ParseGeometryTags(tags);

  // ------------------------------------------------------------------
  // Storage
  // ------------------------------------------------------------------
  const std::filesystem::path cache_root = config.cache().root();
  std::filesystem::create_directories(cache_root);

  app.repository = BuildRepository(config);

  const auto codec_options = ToCodecOptions(config.codec());

  cache::CacheOptions cache_options;
  cache_options.limits.max_artifacts = config.cache().max_artifacts();
  cache_options.limits.max_bytes     = config.cache().max_bytes();
  cache_options.fsync                = config.cache().fsync();

  app.cache = std::make_shared<cache::CacheStore>(app.repository, std::make_shared<storage::DiskArtifactStore>(cache_root),
                                                  codec::EncoderVersion(codec_options), cache_options);

  // ------------------------------------------------------------------
  // Conversion
  // ------------------------------------------------------------------
  codec::FfmpegOptions ffmpeg;
  ffmpeg.ffmpeg_path  = config.codec().ffmpeg_path();
  ffmpeg.ffprobe_path = config.codec().ffprobe_path();
  ffmpeg.codec        = codec_options;

  app.pipeline = std::make_shared<pipeline::ConversionPipeline>(std::make_shared<codec::FfmpegDecoder>(std::move(ffmpeg)), app.cache,
                                                                app.geometries, codec_options);

  app.scheduler = std::make_shared<scheduler::ConversionScheduler>(ToSchedulerOptions(config.scheduler()), app.repository, app.cache,
                                                                   app.pipeline);

  // ------------------------------------------------------------------
  // Serving
  // ------------------------------------------------------------------
  app.stream = std::make_shared<stream::StreamServer>(ToStreamOptions(config.stream()), app.cache, app.geometries);

  service::ServiceContext ctx;
  ctx.cache          = app.cache;
  ctx.scheduler      = app.scheduler;
  ctx.stream         = app.stream;
  ctx.geometries     = app.geometries;
  ctx.items_per_page = config.catalog().items_per_page();
  app.catalog        = std::make_shared<service::CatalogService>(std::move(ctx));

  LEDCAST_LOG_INFO("application built", {StringField("cache_root", cache_root.string()), IntField("geometries", static_cast<int64_t>(app.geometries.size())),
                                         StringField("encoder_version", app.cache->EncoderVersion())});
  return app;
}

void Application::Start() {
  scheduler->Start();
  stream->Start();
}

void Application::Stop() {
  if (stream) stream->Stop();
  if (scheduler) scheduler->Stop();
}

} // namespace ledcast::factory
