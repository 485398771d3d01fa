#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/service/revenue_service.hpp"
#include "streamledger/v1.hpp"

namespace streamledger::grpc {

class RevenueServer final : public streamledger::v1::RevenueService::Service {
public:
  explicit RevenueServer(std::shared_ptr<streamledger::service::RevenueService> svc);

  ::grpc::Status DistributeRevenue(::grpc::ServerContext*,
                                   const streamledger::v1::DistributeRevenueRequest*,
                                   streamledger::v1::DistributeRevenueResponse*) override;

  ::grpc::Status GetAccountBalance(::grpc::ServerContext*,
                                   const streamledger::v1::GetAccountBalanceRequest*,
                                   streamledger::v1::GetAccountBalanceResponse*) override;

private:
  std::shared_ptr<streamledger::service::RevenueService> service_;
};

} // namespace streamledger::grpc
