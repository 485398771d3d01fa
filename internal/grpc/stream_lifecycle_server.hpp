#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/service/stream_lifecycle_service.hpp"
#include "streamledger/v1.hpp"

namespace streamledger::grpc {

class StreamLifecycleServer final : public streamledger::v1::StreamLifecycleService::Service {
public:
  explicit StreamLifecycleServer(std::shared_ptr<streamledger::service::StreamLifecycleService> svc);

  ::grpc::Status CreateStream(::grpc::ServerContext*,
                              const streamledger::v1::CreateStreamRequest*,
                              streamledger::v1::CreateStreamResponse*) override;

  ::grpc::Status StartStream(::grpc::ServerContext*,
                             const streamledger::v1::StartStreamRequest*,
                             google::protobuf::Empty*) override;

  ::grpc::Status EndStream(::grpc::ServerContext*,
                           const streamledger::v1::EndStreamRequest*,
                           streamledger::v1::EndStreamResponse*) override;

  ::grpc::Status StoreSegment(::grpc::ServerContext*,
                              const streamledger::v1::StoreSegmentRequest*,
                              google::protobuf::Empty*) override;

  ::grpc::Status SetModerationScore(::grpc::ServerContext*,
                                    const streamledger::v1::SetModerationScoreRequest*,
                                    google::protobuf::Empty*) override;

  ::grpc::Status GetStream(::grpc::ServerContext*,
                           const streamledger::v1::GetStreamRequest*,
                           streamledger::v1::GetStreamResponse*) override;

  ::grpc::Status GetManifest(::grpc::ServerContext*,
                             const streamledger::v1::GetManifestRequest*,
                             streamledger::v1::GetManifestResponse*) override;

  ::grpc::Status GetSegment(::grpc::ServerContext*,
                            const streamledger::v1::GetSegmentRequest*,
                            streamledger::v1::GetSegmentResponse*) override;

  ::grpc::Status GetAccess(::grpc::ServerContext*,
                           const streamledger::v1::GetAccessRequest*,
                           streamledger::v1::GetAccessResponse*) override;

private:
  std::shared_ptr<streamledger::service::StreamLifecycleService> service_;
};

} // namespace streamledger::grpc
