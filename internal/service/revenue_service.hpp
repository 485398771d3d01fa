#pragma once

#include "service_context.hpp"
#include "streamledger/v1.hpp"

namespace streamledger::service {

class RevenueService {
 public:
  explicit RevenueService(ServiceContext ctx);

  streamledger::v1::DistributeRevenueResponse DistributeRevenue(const streamledger::v1::DistributeRevenueRequest& req);
  streamledger::v1::GetAccountBalanceResponse GetAccountBalance(const streamledger::v1::GetAccountBalanceRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace streamledger::service
