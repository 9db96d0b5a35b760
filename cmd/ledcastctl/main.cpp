#include <grpcpp/grpcpp.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include "ledcast/v1.hpp"
#include "ledcast/v1/catalog_service.grpc.pb.h"

using namespace ledcast::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  ledcastctl <addr> list [search] [page] [sort=name|size|date|served] [order=asc|desc]\n"
            << "  ledcastctl <addr> delete <source_id>\n"
            << "  ledcastctl <addr> reconvert <source_id>\n"
            << "  ledcastctl <addr> scan\n"
            << "  ledcastctl <addr> jobs [all]\n"
            << "  ledcastctl <addr> activity [limit]\n"
            << "  ledcastctl <addr> stats\n";
}

static SortField ParseSort(const std::string& value) {
  if (value == "size") return SORT_FIELD_SIZE;
  if (value == "date") return SORT_FIELD_DATE;
  if (value == "served") return SORT_FIELD_SERVED;
  return SORT_FIELD_NAME;
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_message() << "\n";
  return 2;
}

static std::string ShortId(const std::string& id) {
  return id.substr(0, 12);
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = CatalogService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "list") {
    ListSourcesRequest req;
    if (argc >= 4) req.set_search(argv[3]);
    if (argc >= 5) req.set_page(static_cast<uint32_t>(std::stoul(argv[4])));
    if (argc >= 6) req.set_sort(ParseSort(argv[5]));
    if (argc >= 7) req.set_order(std::string(argv[6]) == "desc" ? SORT_ORDER_DESC : SORT_ORDER_ASC);

    ListSourcesResponse resp;
    auto                status = stub->ListSources(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& source : resp.sources()) {
      std::cout << ShortId(source.source_id()) << "  " << (source.display_name().empty() ? source.filename() : source.display_name())
                << "  bytes=" << source.byte_size() << "  job=" << JobState_Name(source.job_state()) << "  served=" << source.served_count();
      for (const auto& artifact : source.artifacts()) {
        std::cout << "  " << artifact.geometry() << "=" << (artifact.ready() ? std::to_string(artifact.frame_count()) + "f" : "-");
      }
      if (!source.failure_reason().empty()) std::cout << "  error=\"" << source.failure_reason() << "\"";
      std::cout << "\n";
    }
    std::cout << "page " << resp.page() << "/" << resp.total_pages() << " (" << resp.total_count() << " sources)\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "delete") {
    if (argc < 4) return 1;

    DeleteSourceRequest req;
    req.set_source_id(argv[3]);

    DeleteSourceResponse resp;
    auto                 status = stub->DeleteSource(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "deleted artifacts=" << resp.artifacts_removed() << " file_removed=" << (resp.file_removed() ? "yes" : "no") << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "reconvert") {
    if (argc < 4) return 1;

    ReconvertSourceRequest req;
    req.set_source_id(argv[3]);

    ReconvertSourceResponse resp;
    auto                    status = stub->ReconvertSource(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "queued " << ShortId(resp.job().source_id()) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "scan") {
    TriggerScanResponse resp;
    auto                status = stub->TriggerScan(&ctx, TriggerScanRequest(), &resp);
    if (!status.ok()) return Fail(status);

    std::cout << (resp.accepted() ? "scan requested" : "scan rejected") << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "jobs") {
    ListJobsRequest req;
    req.set_include_finished(argc >= 4 && std::string(argv[3]) == "all");

    ListJobsResponse resp;
    auto             status = stub->ListJobs(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& job : resp.jobs()) {
      std::cout << ShortId(job.source_id()) << "  " << JobState_Name(job.state()) << "  attempts=" << job.attempts();
      for (const auto& outcome : job.outcomes()) {
        std::cout << "  " << outcome.geometry() << "=" << (outcome.ok() ? "ok" : ErrorKind_Name(outcome.error_kind()));
      }
      if (!job.last_error().empty()) std::cout << "  error=\"" << job.last_error() << "\"";
      std::cout << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "activity") {
    GetRecentActivityRequest req;
    req.set_limit(argc >= 4 ? static_cast<uint32_t>(std::stoul(argv[3])) : 20);

    GetRecentActivityResponse resp;
    auto                      status = stub->GetRecentActivity(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& event : resp.events()) {
      std::cout << event.time_ms() << "  #" << event.session_id() << "  " << event.peer() << "  " << ActivityKind_Name(event.kind()) << "  "
                << event.geometry() << "  " << event.source_name() << "  sent=" << event.frames_sent() << " dropped=" << event.frames_dropped();
      if (!event.detail().empty()) std::cout << "  " << event.detail();
      std::cout << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "stats") {
    GetStatsResponse resp;
    auto             status = stub->GetStats(&ctx, GetStatsRequest(), &resp);
    if (!status.ok()) return Fail(status);

    const auto& cache = resp.cache();
    std::cout << "artifacts=" << cache.artifact_count() << "/" << cache.max_artifacts() << " bytes=" << cache.total_bytes() << "/"
              << cache.max_bytes() << " sources=" << cache.source_count() << " evictions=" << cache.evictions() << "\n";
    std::cout << "jobs queued=" << resp.queued_jobs() << " running=" << resp.running_jobs() << " failed=" << resp.failed_jobs() << "\n";
    for (const auto& session : resp.sessions()) {
      std::cout << "session #" << session.session_id() << "  " << session.peer() << "  " << session.geometry() << "  "
                << SessionState_Name(session.state()) << "  sent=" << session.frames_sent() << " dropped=" << session.frames_dropped() << "\n";
    }
    return 0;
  }

  Usage();
  return 1;
}
