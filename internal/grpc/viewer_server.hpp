#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/service/viewer_service.hpp"
#include "streamledger/v1.hpp"

namespace streamledger::grpc {

class ViewerServer final : public streamledger::v1::ViewerService::Service {
public:
  explicit ViewerServer(std::shared_ptr<streamledger::service::ViewerService> svc);

  ::grpc::Status JoinStream(::grpc::ServerContext*,
                            const streamledger::v1::JoinStreamRequest*,
                            streamledger::v1::JoinStreamResponse*) override;

  ::grpc::Status UpdateHeartbeat(::grpc::ServerContext*,
                                 const streamledger::v1::UpdateHeartbeatRequest*,
                                 google::protobuf::Empty*) override;

  ::grpc::Status SendTip(::grpc::ServerContext*,
                         const streamledger::v1::SendTipRequest*,
                         google::protobuf::Empty*) override;

  ::grpc::Status GetSession(::grpc::ServerContext*,
                            const streamledger::v1::GetSessionRequest*,
                            streamledger::v1::GetSessionResponse*) override;

private:
  std::shared_ptr<streamledger::service::ViewerService> service_;
};

} // namespace streamledger::grpc
