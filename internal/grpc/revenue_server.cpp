#include "revenue_server.hpp"

#include "grpc_error.hpp"

namespace streamledger::grpc {

RevenueServer::RevenueServer(std::shared_ptr<streamledger::service::RevenueService> svc)
    : service_(std::move(svc)) {}

::grpc::Status RevenueServer::DistributeRevenue(::grpc::ServerContext*,
                                                const streamledger::v1::DistributeRevenueRequest* req,
                                                streamledger::v1::DistributeRevenueResponse* resp) {
  try {
    *resp = service_->DistributeRevenue(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RevenueServer::GetAccountBalance(::grpc::ServerContext*,
                                                const streamledger::v1::GetAccountBalanceRequest* req,
                                                streamledger::v1::GetAccountBalanceResponse* resp) {
  try {
    *resp = service_->GetAccountBalance(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace streamledger::grpc
