#include "viewer_service.hpp"

#include <optional>

#include "internal/core/stream_ledger.hpp"
#include "internal/util/errors.hpp"
#include "observe_rpc.hpp"

namespace streamledger::service {

using namespace streamledger::v1;

ViewerService::ViewerService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

JoinStreamResponse ViewerService::JoinStream(const JoinStreamRequest& req) {
  return ObserveRpc("ViewerService.JoinStream", req.stream().value(), [&] {
    std::optional<uint64_t> payment;
    if (req.has_payment()) {
      payment = req.payment();
    }
    const auto joined = ctx_.ledger->JoinStream(req.sender(), req.stream(), payment);

    JoinStreamResponse resp;
    *resp.mutable_session() = ctx_.ledger->GetSession(joined.session);
    resp.set_change(joined.change);
    return resp;
  });
}

void ViewerService::UpdateHeartbeat(const UpdateHeartbeatRequest& req) {
  ObserveRpc("ViewerService.UpdateHeartbeat", "", [&] {
    if (req.session().value().empty()) {
      throw streamledger::util::InvalidArgument("update heartbeat: missing session id");
    }
    ctx_.ledger->UpdateHeartbeat(req.sender(), req.session(), req.quality_level());
  });
}

void ViewerService::SendTip(const SendTipRequest& req) {
  ObserveRpc("ViewerService.SendTip", req.stream().value(), [&] {
    ctx_.ledger->SendTip(req.sender(), req.stream(), req.session(), req.amount(), req.message());
  });
}

GetSessionResponse ViewerService::GetSession(const GetSessionRequest& req) {
  return ObserveRpc("ViewerService.GetSession", "", [&] {
    GetSessionResponse resp;
    *resp.mutable_session() = ctx_.ledger->GetSession(req.session());
    return resp;
  });
}

} // namespace streamledger::service
