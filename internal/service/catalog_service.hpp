#pragma once

#include "ledcast/v1.hpp"
#include "service_context.hpp"

namespace ledcast::service {

/*
  Transport-agnostic backend of the media listing UI.

  Failures surface as the util error types; the gRPC adapter maps them
  to status codes.
*/
class CatalogService {
 public:
  explicit CatalogService(ServiceContext ctx);

  ledcast::v1::ListSourcesResponse ListSources(const ledcast::v1::ListSourcesRequest& req);

  ledcast::v1::DeleteSourceResponse DeleteSource(const ledcast::v1::DeleteSourceRequest& req);

  ledcast::v1::ReconvertSourceResponse ReconvertSource(const ledcast::v1::ReconvertSourceRequest& req);

  ledcast::v1::TriggerScanResponse TriggerScan(const ledcast::v1::TriggerScanRequest& req);

  ledcast::v1::ListJobsResponse ListJobs(const ledcast::v1::ListJobsRequest& req);

  ledcast::v1::GetRecentActivityResponse GetRecentActivity(const ledcast::v1::GetRecentActivityRequest& req);

  ledcast::v1::GetStatsResponse GetStats(const ledcast::v1::GetStatsRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace ledcast::service
