#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/catalog_service.hpp"
#include "ledcast/v1/catalog_service.grpc.pb.h"

namespace ledcast::grpc {

class CatalogServer final : public ledcast::v1::CatalogService::Service {
 public:
  explicit CatalogServer(std::shared_ptr<ledcast::service::CatalogService> svc);

  ::grpc::Status ListSources(::grpc::ServerContext*, const ledcast::v1::ListSourcesRequest*, ledcast::v1::ListSourcesResponse*) override;

  ::grpc::Status DeleteSource(::grpc::ServerContext*, const ledcast::v1::DeleteSourceRequest*, ledcast::v1::DeleteSourceResponse*) override;

  ::grpc::Status ReconvertSource(::grpc::ServerContext*, const ledcast::v1::ReconvertSourceRequest*,
                                 ledcast::v1::ReconvertSourceResponse*) override;

  ::grpc::Status TriggerScan(::grpc::ServerContext*, const ledcast::v1::TriggerScanRequest*, ledcast::v1::TriggerScanResponse*) override;

  ::grpc::Status ListJobs(::grpc::ServerContext*, const ledcast::v1::ListJobsRequest*, ledcast::v1::ListJobsResponse*) override;

  ::grpc::Status GetRecentActivity(::grpc::ServerContext*, const ledcast::v1::GetRecentActivityRequest*,
                                   ledcast::v1::GetRecentActivityResponse*) override;

  ::grpc::Status GetStats(::grpc::ServerContext*, const ledcast::v1::GetStatsRequest*, ledcast::v1::GetStatsResponse*) override;

 private:
  std::shared_ptr<ledcast::service::CatalogService> service_;
};

} // namespace ledcast::grpc
