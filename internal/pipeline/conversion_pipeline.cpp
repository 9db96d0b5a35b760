#include "conversion_pipeline.hpp"

#include <chrono>
#include <future>
#include <optional>

#include "internal/cache/cache_store.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace ledcast::pipeline {

using ledcast::v1::ErrorKind;
using observability::IntField;
using observability::StringField;

namespace {

GeometryOutcome Success(const std::string& geometry) {
  return GeometryOutcome{geometry, true, ledcast::v1::ERROR_KIND_UNSPECIFIED, {}};
}

GeometryOutcome Failure(const std::string& geometry, ErrorKind kind, std::string reason) {
  return GeometryOutcome{geometry, false, kind, std::move(reason)};
}

bool Cancelled(const std::atomic<bool>* cancel) {
  return cancel && cancel->load();
}

const char* OutcomeLabel(const GeometryOutcome& outcome) {
  if (outcome.ok) return "succeeded";
  return outcome.error_kind == ledcast::v1::ERROR_KIND_ABANDONED ? "abandoned" : "failed";
}

} // namespace

std::size_t ConversionResult::Succeeded() const {
  std::size_t count = 0;
  for (const auto& outcome : outcomes) {
    if (outcome.ok) ++count;
  }
  return count;
}

bool ConversionResult::Abandoned() const {
  bool any = false;
  for (const auto& outcome : outcomes) {
    if (outcome.ok) continue;
    if (outcome.error_kind != ledcast::v1::ERROR_KIND_ABANDONED) return false;
    any = true;
  }
  return any;
}

ConversionPipeline::ConversionPipeline(std::shared_ptr<codec::MediaDecoder> decoder,
                                       std::shared_ptr<cache::CacheStore>   cache,
                                       std::vector<model::TargetGeometry>   geometries,
                                       codec::CodecOptions                  options)
    : decoder_(std::move(decoder)), cache_(std::move(cache)), geometries_(std::move(geometries)), options_(options) {
  if (!decoder_ || !cache_) {
    throw std::invalid_argument("conversion pipeline requires a decoder and a cache store");
  }
}

ConversionResult ConversionPipeline::Convert(const db::model::SourceRecord& source,
                                             const std::filesystem::path&   path,
                                             const std::atomic<bool>*       cancel) {
  observability::SpanScope span("ledcast.convert");
  span.SetAttribute("source.id", source.id);
  const auto started_at = std::chrono::steady_clock::now();

  // Slot per geometry; filled in configuration order at the end.
  std::vector<std::optional<GeometryOutcome>> slots(geometries_.size());
  std::vector<std::size_t>                    pending;
  for (std::size_t i = 0; i < geometries_.size(); ++i) {
    if (cache_->Contains(source.id, geometries_[i].Tag())) {
      slots[i] = Success(geometries_[i].Tag());
      observability::Metrics::Instance().RecordConversion(geometries_[i].Tag(), "skipped");
    } else {
      pending.push_back(i);
    }
  }

  auto fail_pending = [&](ErrorKind kind, const std::string& reason) {
    for (auto i : pending) {
      if (!slots[i]) slots[i] = Failure(geometries_[i].Tag(), kind, reason);
    }
  };

  if (!pending.empty()) {
    std::optional<codec::DecodedMedia> media;
    if (Cancelled(cancel)) {
      fail_pending(ledcast::v1::ERROR_KIND_ABANDONED, "cancelled before decode");
    } else {
      try {
        media = decoder_->Decode(path);
      } catch (const util::DecodeError& e) {
        fail_pending(ledcast::v1::ERROR_KIND_DECODE, e.what());
      } catch (const std::exception& e) {
        fail_pending(ledcast::v1::ERROR_KIND_INTERNAL, e.what());
      }
    }

    if (media) {
      if (media->kind != source.kind) {
        auto refreshed = source;
        refreshed.kind = media->kind;
        cache_->RegisterSource(refreshed);
      }

      std::vector<std::future<model::FrameSequence>> encoded;
      encoded.reserve(pending.size());
      for (auto i : pending) {
        encoded.push_back(std::async(std::launch::async, [this, &media, i]() {
          return codec::EncodeFrames(*media, geometries_[i], options_);
        }));
      }

      for (std::size_t n = 0; n < pending.size(); ++n) {
        const auto i   = pending[n];
        const auto  tag = geometries_[i].Tag();
        if (Cancelled(cancel)) {
          slots[i] = Failure(tag, ledcast::v1::ERROR_KIND_ABANDONED, "conversion cancelled");
          continue;
        }
        try {
          auto frames = encoded[n].get();
          cache_->Put(source.id, frames);
          slots[i] = Success(tag);
        } catch (const util::DecodeError& e) {
          slots[i] = Failure(tag, ledcast::v1::ERROR_KIND_DECODE, e.what());
        } catch (const util::ConfigurationError& e) {
          slots[i] = Failure(tag, ledcast::v1::ERROR_KIND_CONFIGURATION, e.what());
        } catch (const util::CapacityError& e) {
          slots[i] = Failure(tag, ledcast::v1::ERROR_KIND_CAPACITY, e.what());
        } catch (const std::exception& e) {
          slots[i] = Failure(tag, ledcast::v1::ERROR_KIND_INTERNAL, e.what());
        }
      }
    }
  }

  ConversionResult result;
  result.outcomes.reserve(slots.size());
  for (auto& slot : slots) {
    result.outcomes.push_back(std::move(*slot));
  }

  for (auto i : pending) {
    const auto& outcome = result.outcomes[i];
    observability::Metrics::Instance().RecordConversion(outcome.geometry, OutcomeLabel(outcome));
    if (!outcome.ok) {
      LEDCAST_LOG_WARN("geometry conversion failed", {StringField("source", source.id), StringField("geometry", outcome.geometry),
                                                      StringField("kind", ledcast::v1::ErrorKind_Name(outcome.error_kind)),
                                                      StringField("reason", outcome.reason)});
    }
  }

  const auto elapsed_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
  observability::Metrics::Instance().ObserveConversionDurationMs(elapsed_ms);
  span.SetAttribute("succeeded", static_cast<std::int64_t>(result.Succeeded()));

  LEDCAST_LOG_INFO("conversion finished", {StringField("source", source.id), StringField("name", source.display_name),
                                           IntField("succeeded", static_cast<int64_t>(result.Succeeded())),
                                           IntField("geometries", static_cast<int64_t>(result.outcomes.size())),
                                           IntField("skipped", static_cast<int64_t>(geometries_.size() - pending.size())),
                                           IntField("elapsed_ms", static_cast<int64_t>(elapsed_ms))});
  return result;
}

} // namespace ledcast::pipeline
