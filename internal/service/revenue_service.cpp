#include "revenue_service.hpp"

#include "internal/core/stream_ledger.hpp"
#include "observe_rpc.hpp"

namespace streamledger::service {

using namespace streamledger::v1;

RevenueService::RevenueService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

DistributeRevenueResponse RevenueService::DistributeRevenue(const DistributeRevenueRequest& req) {
  return ObserveRpc("RevenueService.DistributeRevenue", req.stream().value(), [&] {
    DistributeRevenueResponse resp;
    resp.set_amount(ctx_.ledger->DistributeRevenue(req.sender(), req.stream()));
    return resp;
  });
}

GetAccountBalanceResponse RevenueService::GetAccountBalance(const GetAccountBalanceRequest& req) {
  return ObserveRpc("RevenueService.GetAccountBalance", "", [&] {
    GetAccountBalanceResponse resp;
    resp.set_balance(ctx_.ledger->GetAccountBalance(req.address()));
    return resp;
  });
}

} // namespace streamledger::service
