#include "catalog_service.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <map>
#include <type_traits>

#include "internal/cache/cache_store.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/scheduler/conversion_scheduler.hpp"
#include "internal/stream/stream_server.hpp"
#include "internal/util/errors.hpp"

namespace ledcast::service {

using namespace ledcast::v1;

namespace {

constexpr uint32_t kDefaultItemsPerPage = 20;

template <typename Fn>
auto ObserveRpc(std::string_view route, const std::string* source_id, Fn&& fn) {
  ledcast::observability::SpanScope span(route);
  if (source_id) {
    span.SetAttribute("source.id", std::string_view(*source_id));
  }

  const auto started_at = std::chrono::steady_clock::now();
  try {
    auto result = fn();
    ledcast::observability::Metrics::Instance().RecordRequest(route, true);
    ledcast::observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
    return result;
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    LEDCAST_LOG_ERROR("RPC failed", {ledcast::observability::StringField("route", route), ledcast::observability::StringField("error", ex.what()),
                                     ledcast::observability::StringField("source_id", source_id ? *source_id : std::string())});
    ledcast::observability::Metrics::Instance().RecordRequest(route, false);
    ledcast::observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
    throw;
  }
}

void RequireSourceId(const std::string& source_id) {
  if (source_id.empty()) {
    throw ledcast::util::InvalidState("source_id is required");
  }
}

std::string Lower(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

std::string SortName(const SourceSummary& summary) {
  return Lower(summary.display_name().empty() ? summary.filename() : summary.display_name());
}

ledcast::v1::JobRecord ToProto(const db::model::JobRecord& record) {
  ledcast::v1::JobRecord job;
  job.set_source_id(record.source_id);
  job.set_state(record.state);
  job.set_attempts(record.attempts);
  job.set_last_error(record.last_error);
  job.set_updated_at_ms(record.updated_at_ms);
  job.set_not_before_ms(record.not_before_ms);
  job.set_encoder_version(record.encoder_version);
  for (const auto& outcome : record.outcomes) {
    auto* out = job.add_outcomes();
    out->set_geometry(outcome.geometry);
    out->set_ok(outcome.ok);
    out->set_error_kind(outcome.error_kind);
    out->set_reason(outcome.reason);
  }
  return job;
}

std::string FailureReason(const db::model::JobRecord& job) {
  if (job.state != JOB_STATE_FAILED && job.state != JOB_STATE_PARTIAL) return {};
  if (!job.last_error.empty()) return job.last_error;
  for (const auto& outcome : job.outcomes) {
    if (!outcome.ok) return outcome.geometry + ": " + outcome.reason;
  }
  return {};
}

SourceSummary Summarize(const cache::SourceListing& listing, const std::vector<model::TargetGeometry>& geometries,
                        const std::map<std::string, db::model::JobRecord>& jobs) {
  SourceSummary summary;
  summary.set_source_id(listing.source.id);
  summary.set_filename(listing.source.filename);
  summary.set_display_name(listing.source.display_name);
  summary.set_kind(listing.source.kind);
  summary.set_byte_size(listing.source.byte_size);
  summary.set_ingested_at_ms(listing.source.ingested_at_ms);

  uint64_t served = 0;
  for (const auto& geometry : geometries) {
    const auto tag    = geometry.Tag();
    auto*      status = summary.add_artifacts();
    status->set_geometry(tag);

    const auto it = std::find_if(listing.artifacts.begin(), listing.artifacts.end(), [&](const auto& a) { return a.geometry == tag; });
    if (it == listing.artifacts.end()) continue;

    status->set_ready(true);
    status->set_frame_count(it->frame_count);
    status->set_byte_size(it->byte_size);
    status->set_served_count(it->served_count);
    status->set_last_served_ms(it->last_served_ms);
    status->set_encoder_version(it->encoder_version);
    status->set_loop(it->loop);
    served += it->served_count;
  }
  summary.set_served_count(served);

  const auto job = jobs.find(listing.source.id);
  if (job != jobs.end()) {
    summary.set_job_state(job->second.state);
    summary.set_failure_reason(FailureReason(job->second));
  }
  return summary;
}

} // namespace

CatalogService::CatalogService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

ListSourcesResponse CatalogService::ListSources(const ListSourcesRequest& req) {
  return ObserveRpc("CatalogService.ListSources", nullptr, [&] {
    std::map<std::string, db::model::JobRecord> jobs;
    for (auto& job : ctx_.scheduler->ListJobs(true)) {
      jobs.emplace(job.source_id, std::move(job));
    }

    const auto needle = Lower(req.search());

    std::vector<SourceSummary> matches;
    for (const auto& listing : ctx_.cache->List()) {
      if (!needle.empty() && Lower(listing.source.filename).find(needle) == std::string::npos &&
          Lower(listing.source.display_name).find(needle) == std::string::npos) {
        continue;
      }
      matches.push_back(Summarize(listing, ctx_.geometries, jobs));
    }

    const bool descending = req.order() == SORT_ORDER_DESC;
    std::stable_sort(matches.begin(), matches.end(), [&](const SourceSummary& a, const SourceSummary& b) {
      const auto name_a = SortName(a);
      const auto name_b = SortName(b);

      int cmp = 0;
      switch (req.sort()) {
        case SORT_FIELD_SIZE:
          cmp = a.byte_size() < b.byte_size() ? -1 : (a.byte_size() > b.byte_size() ? 1 : 0);
          break;
        case SORT_FIELD_DATE:
          cmp = a.ingested_at_ms() < b.ingested_at_ms() ? -1 : (a.ingested_at_ms() > b.ingested_at_ms() ? 1 : 0);
          break;
        case SORT_FIELD_SERVED:
          cmp = a.served_count() < b.served_count() ? -1 : (a.served_count() > b.served_count() ? 1 : 0);
          break;
        default:
          cmp = name_a.compare(name_b);
          break;
      }
      if (cmp != 0) return descending ? cmp > 0 : cmp < 0;
      // Ties always read alphabetically.
      return name_a < name_b;
    });

    const uint32_t page_size   = req.page_size() ? req.page_size() : (ctx_.items_per_page ? ctx_.items_per_page : kDefaultItemsPerPage);
    const uint64_t total       = matches.size();
    const uint32_t total_pages = std::max<uint32_t>(1, static_cast<uint32_t>((total + page_size - 1) / page_size));
    const uint32_t page        = std::max<uint32_t>(1, req.page());

    ListSourcesResponse resp;
    resp.set_total_count(total);
    resp.set_page(page);
    resp.set_page_size(page_size);
    resp.set_total_pages(total_pages);
    for (const auto& geometry : ctx_.geometries) {
      resp.add_geometries(geometry.Tag());
    }

    const uint64_t first = static_cast<uint64_t>(page - 1) * page_size;
    for (uint64_t i = first; i < total && i < first + page_size; ++i) {
      *resp.add_sources() = std::move(matches[i]);
    }
    return resp;
  });
}

DeleteSourceResponse CatalogService::DeleteSource(const DeleteSourceRequest& req) {
  return ObserveRpc("CatalogService.DeleteSource", &req.source_id(), [&] {
    RequireSourceId(req.source_id());
    const auto report = ctx_.scheduler->DeleteSource(req.source_id());

    DeleteSourceResponse resp;
    resp.set_artifacts_removed(static_cast<uint32_t>(report.artifacts_removed));
    resp.set_file_removed(report.file_removed);
    return resp;
  });
}

ReconvertSourceResponse CatalogService::ReconvertSource(const ReconvertSourceRequest& req) {
  return ObserveRpc("CatalogService.ReconvertSource", &req.source_id(), [&] {
    RequireSourceId(req.source_id());

    ReconvertSourceResponse resp;
    *resp.mutable_job() = ToProto(ctx_.scheduler->Reconvert(req.source_id()));
    return resp;
  });
}

TriggerScanResponse CatalogService::TriggerScan(const TriggerScanRequest&) {
  return ObserveRpc("CatalogService.TriggerScan", nullptr, [&] {
    ctx_.scheduler->TriggerScan();

    TriggerScanResponse resp;
    resp.set_accepted(true);
    return resp;
  });
}

ListJobsResponse CatalogService::ListJobs(const ListJobsRequest& req) {
  return ObserveRpc("CatalogService.ListJobs", nullptr, [&] {
    ListJobsResponse resp;
    for (const auto& job : ctx_.scheduler->ListJobs(req.include_finished())) {
      *resp.add_jobs() = ToProto(job);
    }
    return resp;
  });
}

GetRecentActivityResponse CatalogService::GetRecentActivity(const GetRecentActivityRequest& req) {
  return ObserveRpc("CatalogService.GetRecentActivity", nullptr, [&] {
    GetRecentActivityResponse resp;
    if (!ctx_.stream) return resp;
    for (auto& event : ctx_.stream->RecentActivity(req.limit())) {
      *resp.add_events() = std::move(event);
    }
    return resp;
  });
}

GetStatsResponse CatalogService::GetStats(const GetStatsRequest&) {
  return ObserveRpc("CatalogService.GetStats", nullptr, [&] {
    const auto stats = ctx_.cache->Stats();

    GetStatsResponse resp;
    auto*            cache = resp.mutable_cache();
    cache->set_artifact_count(stats.artifact_count);
    cache->set_total_bytes(stats.total_bytes);
    cache->set_max_artifacts(stats.limits.max_artifacts);
    cache->set_max_bytes(stats.limits.max_bytes);
    cache->set_source_count(stats.source_count);
    cache->set_evictions(stats.evictions);

    if (ctx_.stream) {
      for (auto& session : ctx_.stream->Snapshots()) {
        *resp.add_sessions() = std::move(session);
      }
    }

    const auto counts = ctx_.scheduler->Counts();
    resp.set_queued_jobs(static_cast<uint32_t>(counts.queued));
    resp.set_running_jobs(static_cast<uint32_t>(counts.running));
    resp.set_failed_jobs(static_cast<uint32_t>(counts.failed));
    return resp;
  });
}

} // namespace ledcast::service
