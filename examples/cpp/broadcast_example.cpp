#include <grpcpp/client_context.h>
#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include <cstdint>
#include <iostream>
#include <memory>
#include <string>

#include "streamledger/v1.hpp"

namespace {

streamledger::v1::Address MakeAddress(const std::string& value) {
  streamledger::v1::Address address;
  address.set_value(value);
  return address;
}

streamledger::v1::BlobRef MakeBlob(const std::string& value) {
  streamledger::v1::BlobRef blob;
  blob.set_value(value);
  return blob;
}

bool Check(const grpc::Status& status, const char* what) {
  if (!status.ok()) {
    std::cerr << what << " failed: " << status.error_message() << " (" << status.error_details() << ")\n";
    return false;
  }
  return true;
}

} // namespace

int main(int argc, char** argv) {
  // Optional endpoint argument keeps the example portable across environments.
  const std::string target = argc > 1 ? argv[1] : "localhost:50051";

  auto channel   = grpc::CreateChannel(target, grpc::InsecureChannelCredentials());
  auto lifecycle = streamledger::v1::StreamLifecycleService::NewStub(channel);
  auto viewers   = streamledger::v1::ViewerService::NewStub(channel);
  auto revenue   = streamledger::v1::RevenueService::NewStub(channel);

  const auto creator = MakeAddress("0xc0ffee");
  const auto viewer  = MakeAddress("0xbeef");

  // Monetized stream at 10 units, tips on, two quality tiers.
  streamledger::v1::CreateStreamRequest create_request;
  *create_request.mutable_sender() = creator;
  auto* config                     = create_request.mutable_config();
  config->set_title("example broadcast");
  config->set_category("demo");
  config->add_quality_levels(1);
  config->add_quality_levels(3);
  config->set_is_monetized(true);
  config->set_subscription_price(10);
  config->set_tip_enabled(true);

  streamledger::v1::CreateStreamResponse created;
  {
    grpc::ClientContext ctx;
    if (!Check(lifecycle->CreateStream(&ctx, create_request, &created), "CreateStream")) {
      return 1;
    }
  }
  const auto stream = created.stream().id();
  std::cout << "created stream " << stream.value() << '\n';

  google::protobuf::Empty empty;

  streamledger::v1::StartStreamRequest start_request;
  *start_request.mutable_sender()   = creator;
  *start_request.mutable_stream()   = stream;
  *start_request.mutable_manifest() = MakeBlob("blob://manifest/0");
  {
    grpc::ClientContext ctx;
    if (!Check(lifecycle->StartStream(&ctx, start_request, &empty), "StartStream")) {
      return 1;
    }
  }

  for (uint64_t segment = 0; segment < 3; ++segment) {
    streamledger::v1::StoreSegmentRequest segment_request;
    *segment_request.mutable_sender() = creator;
    *segment_request.mutable_stream() = stream;
    segment_request.set_segment_number(segment);
    *segment_request.mutable_blob() = MakeBlob("blob://segment/" + std::to_string(segment));

    grpc::ClientContext ctx;
    if (!Check(lifecycle->StoreSegment(&ctx, segment_request, &empty), "StoreSegment")) {
      return 1;
    }
  }

  // Viewer pays 15; the surplus stays with the stream.
  streamledger::v1::JoinStreamRequest join_request;
  *join_request.mutable_sender() = viewer;
  *join_request.mutable_stream() = stream;
  join_request.set_payment(15);

  streamledger::v1::JoinStreamResponse joined;
  {
    grpc::ClientContext ctx;
    if (!Check(viewers->JoinStream(&ctx, join_request, &joined), "JoinStream")) {
      return 1;
    }
  }
  const auto session = joined.session().id();

  streamledger::v1::UpdateHeartbeatRequest heartbeat_request;
  *heartbeat_request.mutable_sender()  = viewer;
  *heartbeat_request.mutable_session() = session;
  heartbeat_request.set_quality_level(3);
  {
    grpc::ClientContext ctx;
    if (!Check(viewers->UpdateHeartbeat(&ctx, heartbeat_request, &empty), "UpdateHeartbeat")) {
      return 1;
    }
  }

  streamledger::v1::SendTipRequest tip_request;
  *tip_request.mutable_sender()  = viewer;
  *tip_request.mutable_stream()  = stream;
  *tip_request.mutable_session() = session;
  tip_request.set_amount(5);
  tip_request.set_message("great stream");
  {
    grpc::ClientContext ctx;
    if (!Check(viewers->SendTip(&ctx, tip_request, &empty), "SendTip")) {
      return 1;
    }
  }

  streamledger::v1::EndStreamRequest end_request;
  *end_request.mutable_sender() = creator;
  *end_request.mutable_stream() = stream;

  streamledger::v1::EndStreamResponse ended;
  {
    grpc::ClientContext ctx;
    if (!Check(lifecycle->EndStream(&ctx, end_request, &ended), "EndStream")) {
      return 1;
    }
  }
  std::cout << "ended: viewers=" << ended.viewer_count() << " revenue=" << ended.total_revenue() << " duration_ms=" << ended.duration_ms()
            << '\n';

  streamledger::v1::DistributeRevenueRequest distribute_request;
  *distribute_request.mutable_sender() = creator;
  *distribute_request.mutable_stream() = stream;

  streamledger::v1::DistributeRevenueResponse distributed;
  {
    grpc::ClientContext ctx;
    if (!Check(revenue->DistributeRevenue(&ctx, distribute_request, &distributed), "DistributeRevenue")) {
      return 1;
    }
  }

  streamledger::v1::GetAccountBalanceRequest balance_request;
  *balance_request.mutable_address() = creator;

  streamledger::v1::GetAccountBalanceResponse balance;
  {
    grpc::ClientContext ctx;
    if (!Check(revenue->GetAccountBalance(&ctx, balance_request, &balance), "GetAccountBalance")) {
      return 1;
    }
  }

  std::cout << "distributed " << distributed.amount() << ", creator balance " << balance.balance() << '\n';
  return 0;
}
