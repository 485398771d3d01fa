#include "stream_lifecycle_server.hpp"

#include "grpc_error.hpp"

namespace streamledger::grpc {

StreamLifecycleServer::StreamLifecycleServer(std::shared_ptr<streamledger::service::StreamLifecycleService> svc)
    : service_(std::move(svc)) {}

::grpc::Status StreamLifecycleServer::CreateStream(::grpc::ServerContext*,
                                                   const streamledger::v1::CreateStreamRequest* req,
                                                   streamledger::v1::CreateStreamResponse* resp) {
  try {
    *resp = service_->CreateStream(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status StreamLifecycleServer::StartStream(::grpc::ServerContext*,
                                                  const streamledger::v1::StartStreamRequest* req,
                                                  google::protobuf::Empty*) {
  try {
    service_->StartStream(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status StreamLifecycleServer::EndStream(::grpc::ServerContext*,
                                                const streamledger::v1::EndStreamRequest* req,
                                                streamledger::v1::EndStreamResponse* resp) {
  try {
    *resp = service_->EndStream(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status StreamLifecycleServer::StoreSegment(::grpc::ServerContext*,
                                                   const streamledger::v1::StoreSegmentRequest* req,
                                                   google::protobuf::Empty*) {
  try {
    service_->StoreSegment(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status StreamLifecycleServer::SetModerationScore(::grpc::ServerContext*,
                                                         const streamledger::v1::SetModerationScoreRequest* req,
                                                         google::protobuf::Empty*) {
  try {
    service_->SetModerationScore(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status StreamLifecycleServer::GetStream(::grpc::ServerContext*,
                                                const streamledger::v1::GetStreamRequest* req,
                                                streamledger::v1::GetStreamResponse* resp) {
  try {
    *resp = service_->GetStream(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status StreamLifecycleServer::GetManifest(::grpc::ServerContext*,
                                                  const streamledger::v1::GetManifestRequest* req,
                                                  streamledger::v1::GetManifestResponse* resp) {
  try {
    *resp = service_->GetManifest(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status StreamLifecycleServer::GetSegment(::grpc::ServerContext*,
                                                 const streamledger::v1::GetSegmentRequest* req,
                                                 streamledger::v1::GetSegmentResponse* resp) {
  try {
    *resp = service_->GetSegment(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status StreamLifecycleServer::GetAccess(::grpc::ServerContext*,
                                                const streamledger::v1::GetAccessRequest* req,
                                                streamledger::v1::GetAccessResponse* resp) {
  try {
    *resp = service_->GetAccess(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace streamledger::grpc
