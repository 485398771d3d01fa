#pragma once

#include "service_context.hpp"
#include "streamledger/v1.hpp"

namespace streamledger::service {

class ViewerService {
 public:
  explicit ViewerService(ServiceContext ctx);

  streamledger::v1::JoinStreamResponse JoinStream(const streamledger::v1::JoinStreamRequest& req);
  void                                 UpdateHeartbeat(const streamledger::v1::UpdateHeartbeatRequest& req);
  void                                 SendTip(const streamledger::v1::SendTipRequest& req);
  streamledger::v1::GetSessionResponse GetSession(const streamledger::v1::GetSessionRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace streamledger::service
