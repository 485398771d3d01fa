#include "stream_lifecycle_service.hpp"

#include "internal/core/stream_ledger.hpp"
#include "internal/util/errors.hpp"
#include "observe_rpc.hpp"

namespace streamledger::service {

using namespace streamledger::v1;

namespace {

void RequireStream(const StreamID& stream, const char* op) {
  if (stream.value().empty()) {
    throw streamledger::util::InvalidArgument(std::string(op) + ": missing stream id; set stream.value and retry");
  }
}

} // namespace

StreamLifecycleService::StreamLifecycleService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

CreateStreamResponse StreamLifecycleService::CreateStream(const CreateStreamRequest& req) {
  return ObserveRpc("StreamLifecycleService.CreateStream", "", [&] {
    const auto id = ctx_.ledger->CreateStream(req.sender(), req.config());

    CreateStreamResponse resp;
    *resp.mutable_stream() = ctx_.ledger->GetStream(id);
    return resp;
  });
}

void StreamLifecycleService::StartStream(const StartStreamRequest& req) {
  ObserveRpc("StreamLifecycleService.StartStream", req.stream().value(), [&] {
    RequireStream(req.stream(), "start stream");
    ctx_.ledger->StartStream(req.sender(), req.stream(), req.manifest());
  });
}

EndStreamResponse StreamLifecycleService::EndStream(const EndStreamRequest& req) {
  return ObserveRpc("StreamLifecycleService.EndStream", req.stream().value(), [&] {
    RequireStream(req.stream(), "end stream");
    const auto ended = ctx_.ledger->EndStream(req.sender(), req.stream());

    EndStreamResponse resp;
    resp.set_duration_ms(ended.duration_ms());
    resp.set_viewer_count(ended.viewer_count());
    resp.set_total_revenue(ended.total_revenue());
    resp.set_ended_at_ms(ended.ended_at_ms());
    return resp;
  });
}

void StreamLifecycleService::StoreSegment(const StoreSegmentRequest& req) {
  ObserveRpc("StreamLifecycleService.StoreSegment", req.stream().value(), [&] {
    RequireStream(req.stream(), "store segment");
    ctx_.ledger->StoreSegment(req.sender(), req.stream(), req.segment_number(), req.blob());
  });
}

void StreamLifecycleService::SetModerationScore(const SetModerationScoreRequest& req) {
  ObserveRpc("StreamLifecycleService.SetModerationScore", req.stream().value(), [&] {
    RequireStream(req.stream(), "set moderation score");
    ctx_.ledger->SetModerationScore(req.sender(), req.stream(), req.score());
  });
}

GetStreamResponse StreamLifecycleService::GetStream(const GetStreamRequest& req) {
  return ObserveRpc("StreamLifecycleService.GetStream", req.stream().value(), [&] {
    RequireStream(req.stream(), "get stream");
    GetStreamResponse resp;
    *resp.mutable_stream() = ctx_.ledger->GetStream(req.stream());
    return resp;
  });
}

GetManifestResponse StreamLifecycleService::GetManifest(const GetManifestRequest& req) {
  return ObserveRpc("StreamLifecycleService.GetManifest", req.stream().value(), [&] {
    RequireStream(req.stream(), "get manifest");
    GetManifestResponse resp;
    *resp.mutable_manifest() = ctx_.ledger->GetManifest(req.stream());
    return resp;
  });
}

GetSegmentResponse StreamLifecycleService::GetSegment(const GetSegmentRequest& req) {
  return ObserveRpc("StreamLifecycleService.GetSegment", req.stream().value(), [&] {
    RequireStream(req.stream(), "get segment");
    GetSegmentResponse resp;
    *resp.mutable_segment() = ctx_.ledger->GetSegment(req.stream(), req.segment_number());
    return resp;
  });
}

GetAccessResponse StreamLifecycleService::GetAccess(const GetAccessRequest& req) {
  return ObserveRpc("StreamLifecycleService.GetAccess", req.stream().value(), [&] {
    RequireStream(req.stream(), "get access");
    // one snapshot so the four flags agree
    const auto summary = ctx_.ledger->GetStream(req.stream());

    GetAccessResponse resp;
    resp.set_is_live(summary.status() == STREAM_STATUS_LIVE);
    resp.set_is_monetized(summary.is_monetized());
    resp.set_subscription_price(summary.subscription_price());
    resp.set_tip_enabled(summary.tip_enabled());
    return resp;
  });
}

} // namespace streamledger::service
