#include "viewer_server.hpp"

#include "grpc_error.hpp"

namespace streamledger::grpc {

ViewerServer::ViewerServer(std::shared_ptr<streamledger::service::ViewerService> svc)
    : service_(std::move(svc)) {}

::grpc::Status ViewerServer::JoinStream(::grpc::ServerContext*,
                                        const streamledger::v1::JoinStreamRequest* req,
                                        streamledger::v1::JoinStreamResponse* resp) {
  try {
    *resp = service_->JoinStream(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ViewerServer::UpdateHeartbeat(::grpc::ServerContext*,
                                             const streamledger::v1::UpdateHeartbeatRequest* req,
                                             google::protobuf::Empty*) {
  try {
    service_->UpdateHeartbeat(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ViewerServer::SendTip(::grpc::ServerContext*,
                                     const streamledger::v1::SendTipRequest* req,
                                     google::protobuf::Empty*) {
  try {
    service_->SendTip(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ViewerServer::GetSession(::grpc::ServerContext*,
                                        const streamledger::v1::GetSessionRequest* req,
                                        streamledger::v1::GetSessionResponse* resp) {
  try {
    *resp = service_->GetSession(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace streamledger::grpc
