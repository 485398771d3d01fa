#pragma once

#include "service_context.hpp"
#include "streamledger/v1.hpp"

namespace streamledger::service {

class StreamLifecycleService {
 public:
  explicit StreamLifecycleService(ServiceContext ctx);

  streamledger::v1::CreateStreamResponse CreateStream(const streamledger::v1::CreateStreamRequest& req);
  void                                   StartStream(const streamledger::v1::StartStreamRequest& req);
  streamledger::v1::EndStreamResponse    EndStream(const streamledger::v1::EndStreamRequest& req);
  void                                   StoreSegment(const streamledger::v1::StoreSegmentRequest& req);
  void                                   SetModerationScore(const streamledger::v1::SetModerationScoreRequest& req);

  streamledger::v1::GetStreamResponse   GetStream(const streamledger::v1::GetStreamRequest& req);
  streamledger::v1::GetManifestResponse GetManifest(const streamledger::v1::GetManifestRequest& req);
  streamledger::v1::GetSegmentResponse  GetSegment(const streamledger::v1::GetSegmentRequest& req);
  streamledger::v1::GetAccessResponse   GetAccess(const streamledger::v1::GetAccessRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace streamledger::service
