#include "registry_server.hpp"

#include "grpc_error.hpp"

namespace streamledger::grpc {

RegistryServer::RegistryServer(std::shared_ptr<streamledger::service::RegistryService> svc)
    : service_(std::move(svc)) {}

::grpc::Status RegistryServer::GetRegistry(::grpc::ServerContext*,
                                           const streamledger::v1::GetRegistryRequest* req,
                                           streamledger::v1::GetRegistryResponse* resp) {
  try {
    *resp = service_->GetRegistry(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RegistryServer::ListCategory(::grpc::ServerContext*,
                                            const streamledger::v1::ListCategoryRequest* req,
                                            streamledger::v1::ListCategoryResponse* resp) {
  try {
    *resp = service_->ListCategory(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RegistryServer::ListEvents(::grpc::ServerContext*,
                                          const streamledger::v1::ListEventsRequest* req,
                                          streamledger::v1::ListEventsResponse* resp) {
  try {
    *resp = service_->ListEvents(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace streamledger::grpc
