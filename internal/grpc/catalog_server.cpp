#include "catalog_server.hpp"

#include "grpc_error.hpp"

namespace ledcast::grpc {

namespace {

template <typename Fn>
::grpc::Status Handle(Fn&& fn) {
  try {
    fn();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace

CatalogServer::CatalogServer(std::shared_ptr<ledcast::service::CatalogService> svc) : service_(std::move(svc)) {
}

::grpc::Status CatalogServer::ListSources(::grpc::ServerContext*, const ledcast::v1::ListSourcesRequest* req,
                                          ledcast::v1::ListSourcesResponse* resp) {
  return Handle([&] { *resp = service_->ListSources(*req); });
}

::grpc::Status CatalogServer::DeleteSource(::grpc::ServerContext*, const ledcast::v1::DeleteSourceRequest* req,
                                           ledcast::v1::DeleteSourceResponse* resp) {
  return Handle([&] { *resp = service_->DeleteSource(*req); });
}

::grpc::Status CatalogServer::ReconvertSource(::grpc::ServerContext*, const ledcast::v1::ReconvertSourceRequest* req,
                                              ledcast::v1::ReconvertSourceResponse* resp) {
  return Handle([&] { *resp = service_->ReconvertSource(*req); });
}

::grpc::Status CatalogServer::TriggerScan(::grpc::ServerContext*, const ledcast::v1::TriggerScanRequest* req,
                                          ledcast::v1::TriggerScanResponse* resp) {
  return Handle([&] { *resp = service_->TriggerScan(*req); });
}

::grpc::Status CatalogServer::ListJobs(::grpc::ServerContext*, const ledcast::v1::ListJobsRequest* req, ledcast::v1::ListJobsResponse* resp) {
  return Handle([&] { *resp = service_->ListJobs(*req); });
}

::grpc::Status CatalogServer::GetRecentActivity(::grpc::ServerContext*, const ledcast::v1::GetRecentActivityRequest* req,
                                                ledcast::v1::GetRecentActivityResponse* resp) {
  return Handle([&] { *resp = service_->GetRecentActivity(*req); });
}

::grpc::Status CatalogServer::GetStats(::grpc::ServerContext*, const ledcast::v1::GetStatsRequest* req, ledcast::v1::GetStatsResponse* resp) {
  return Handle([&] { *resp = service_->GetStats(*req); });
}

} // namespace ledcast::grpc
