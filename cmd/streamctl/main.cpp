#include <grpcpp/grpcpp.h>

#include <google/protobuf/util/json_util.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "parse.hpp"
#include "streamledger/v1.hpp"

using namespace streamledger::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  streamctl <addr> create <sender> <title> <category> [price] [tips=0|1] [qualities=0,2,4]\n"
            << "  streamctl <addr> start <sender> <stream_id> <manifest>\n"
            << "  streamctl <addr> end <sender> <stream_id>\n"
            << "  streamctl <addr> store-segment <sender> <stream_id> <segment_number> <blob>\n"
            << "  streamctl <addr> moderate <sender> <stream_id> <score>\n"
            << "  streamctl <addr> join <sender> <stream_id> [payment]\n"
            << "  streamctl <addr> heartbeat <sender> <session_id> <quality_level>\n"
            << "  streamctl <addr> tip <sender> <stream_id> <session_id> <amount> [message]\n"
            << "  streamctl <addr> distribute <sender> <stream_id>\n"
            << "  streamctl <addr> stream <stream_id>\n"
            << "  streamctl <addr> manifest <stream_id>\n"
            << "  streamctl <addr> segment <stream_id> <segment_number>\n"
            << "  streamctl <addr> access <stream_id>\n"
            << "  streamctl <addr> session <session_id>\n"
            << "  streamctl <addr> registry\n"
            << "  streamctl <addr> category <category>\n"
            << "  streamctl <addr> balance <address>\n"
            << "  streamctl <addr> events [after_sequence] [max_events]\n";
}

static Address MakeAddress(const std::string& s) {
  Address a;
  a.set_value(s);
  return a;
}

static StreamID MakeStreamID(const std::string& s) {
  StreamID id;
  id.set_value(s);
  return id;
}

static SessionID MakeSessionID(const std::string& s) {
  SessionID id;
  id.set_value(s);
  return id;
}

static BlobRef MakeBlob(const std::string& s) {
  BlobRef b;
  b.set_value(s);
  return b;
}

static uint64_t ParseU64(const char* value) {
  if (const auto parsed = streamledger::cli::ParseUnsigned<uint64_t>(value)) return *parsed;
  std::cerr << "invalid number: " << value << "\n";
  std::exit(1);
}

static uint32_t ParseU32(const char* value) {
  if (const auto parsed = streamledger::cli::ParseUnsigned<uint32_t>(value)) return *parsed;
  std::cerr << "invalid number: " << value << "\n";
  std::exit(1);
}

static std::vector<uint32_t> ParseQualityList(const char* csv) {
  if (auto parsed = streamledger::cli::ParseQualities(csv)) return std::move(*parsed);
  std::cerr << "invalid quality list: " << csv << "\n";
  std::exit(1);
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_message();
  if (!status.error_details().empty()) std::cerr << " (" << status.error_details() << ")";
  std::cerr << "\n";
  return 2;
}

static void PrintJson(const google::protobuf::Message& message) {
  std::string                              out;
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;
  if (!google::protobuf::util::MessageToJsonString(message, &out, options).ok()) {
    std::cerr << "failed to render " << message.GetTypeName() << "\n";
    return;
  }
  std::cout << out;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());

  auto lifecycle_stub = StreamLifecycleService::NewStub(channel);
  auto viewer_stub    = ViewerService::NewStub(channel);
  auto revenue_stub   = RevenueService::NewStub(channel);
  auto registry_stub  = RegistryService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "create") {
    if (argc < 6) return 1;

    CreateStreamRequest req;
    *req.mutable_sender() = MakeAddress(argv[3]);
    auto* config          = req.mutable_config();
    config->set_title(argv[4]);
    config->set_category(argv[5]);
    if (argc >= 7) {
      const auto price = ParseU64(argv[6]);
      config->set_is_monetized(price > 0);
      config->set_subscription_price(price);
    }
    config->set_tip_enabled(argc >= 8 && std::string(argv[7]) == "1");
    for (auto q : ParseQualityList(argc >= 9 ? argv[8] : "2")) config->add_quality_levels(q);

    CreateStreamResponse resp;

    auto status = lifecycle_stub->CreateStream(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "stream=" << resp.stream().id().value() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "start") {
    if (argc < 6) return 1;

    StartStreamRequest req;
    *req.mutable_sender()   = MakeAddress(argv[3]);
    *req.mutable_stream()   = MakeStreamID(argv[4]);
    *req.mutable_manifest() = MakeBlob(argv[5]);

    google::protobuf::Empty resp;

    auto status = lifecycle_stub->StartStream(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "live\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "end") {
    if (argc < 5) return 1;

    EndStreamRequest req;
    *req.mutable_sender() = MakeAddress(argv[3]);
    *req.mutable_stream() = MakeStreamID(argv[4]);

    EndStreamResponse resp;

    auto status = lifecycle_stub->EndStream(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "duration_ms=" << resp.duration_ms() << "\n";
    std::cout << "viewers=" << resp.viewer_count() << "\n";
    std::cout << "revenue=" << resp.total_revenue() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "store-segment") {
    if (argc < 7) return 1;

    StoreSegmentRequest req;
    *req.mutable_sender() = MakeAddress(argv[3]);
    *req.mutable_stream() = MakeStreamID(argv[4]);
    req.set_segment_number(ParseU64(argv[5]));
    *req.mutable_blob() = MakeBlob(argv[6]);

    google::protobuf::Empty resp;

    auto status = lifecycle_stub->StoreSegment(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "stored\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "moderate") {
    if (argc < 6) return 1;

    SetModerationScoreRequest req;
    *req.mutable_sender() = MakeAddress(argv[3]);
    *req.mutable_stream() = MakeStreamID(argv[4]);
    req.set_score(ParseU32(argv[5]));

    google::protobuf::Empty resp;

    auto status = lifecycle_stub->SetModerationScore(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "updated\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "join") {
    if (argc < 5) return 1;

    JoinStreamRequest req;
    *req.mutable_sender() = MakeAddress(argv[3]);
    *req.mutable_stream() = MakeStreamID(argv[4]);
    if (argc >= 6) req.set_payment(ParseU64(argv[5]));

    JoinStreamResponse resp;

    auto status = viewer_stub->JoinStream(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "session=" << resp.session().id().value() << "\n";
    std::cout << "change=" << resp.change() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "heartbeat") {
    if (argc < 6) return 1;

    UpdateHeartbeatRequest req;
    *req.mutable_sender()  = MakeAddress(argv[3]);
    *req.mutable_session() = MakeSessionID(argv[4]);
    req.set_quality_level(ParseU32(argv[5]));

    google::protobuf::Empty resp;

    auto status = viewer_stub->UpdateHeartbeat(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "ok\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "tip") {
    if (argc < 7) return 1;

    SendTipRequest req;
    *req.mutable_sender()  = MakeAddress(argv[3]);
    *req.mutable_stream()  = MakeStreamID(argv[4]);
    *req.mutable_session() = MakeSessionID(argv[5]);
    req.set_amount(ParseU64(argv[6]));
    if (argc >= 8) req.set_message(argv[7]);

    google::protobuf::Empty resp;

    auto status = viewer_stub->SendTip(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "sent\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "distribute") {
    if (argc < 5) return 1;

    DistributeRevenueRequest req;
    *req.mutable_sender() = MakeAddress(argv[3]);
    *req.mutable_stream() = MakeStreamID(argv[4]);

    DistributeRevenueResponse resp;

    auto status = revenue_stub->DistributeRevenue(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "amount=" << resp.amount() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "stream") {
    if (argc < 4) return 1;

    GetStreamRequest req;
    *req.mutable_stream() = MakeStreamID(argv[3]);

    GetStreamResponse resp;

    auto status = lifecycle_stub->GetStream(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintJson(resp.stream());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "manifest") {
    if (argc < 4) return 1;

    GetManifestRequest req;
    *req.mutable_stream() = MakeStreamID(argv[3]);

    GetManifestResponse resp;

    auto status = lifecycle_stub->GetManifest(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "manifest=" << resp.manifest().value() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "segment") {
    if (argc < 5) return 1;

    GetSegmentRequest req;
    *req.mutable_stream() = MakeStreamID(argv[3]);
    req.set_segment_number(ParseU64(argv[4]));

    GetSegmentResponse resp;

    auto status = lifecycle_stub->GetSegment(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "blob=" << resp.segment().blob().value() << "\n";
    std::cout << "stored_at_ms=" << resp.segment().stored_at_ms() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "access") {
    if (argc < 4) return 1;

    GetAccessRequest req;
    *req.mutable_stream() = MakeStreamID(argv[3]);

    GetAccessResponse resp;

    auto status = lifecycle_stub->GetAccess(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "live=" << resp.is_live() << "\n";
    std::cout << "monetized=" << resp.is_monetized() << "\n";
    std::cout << "price=" << resp.subscription_price() << "\n";
    std::cout << "tips=" << resp.tip_enabled() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "session") {
    if (argc < 4) return 1;

    GetSessionRequest req;
    *req.mutable_session() = MakeSessionID(argv[3]);

    GetSessionResponse resp;

    auto status = viewer_stub->GetSession(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintJson(resp.session());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "registry") {
    GetRegistryRequest  req;
    GetRegistryResponse resp;

    auto status = registry_stub->GetRegistry(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "total=" << resp.registry().total_streams() << "\n";
    std::cout << "active=" << resp.registry().active_streams() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "category") {
    if (argc < 4) return 1;

    ListCategoryRequest req;
    req.set_category(argv[3]);

    ListCategoryResponse resp;

    auto status = registry_stub->ListCategory(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& id : resp.streams()) std::cout << id.value() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "balance") {
    if (argc < 4) return 1;

    GetAccountBalanceRequest req;
    *req.mutable_address() = MakeAddress(argv[3]);

    GetAccountBalanceResponse resp;

    auto status = revenue_stub->GetAccountBalance(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "balance=" << resp.balance() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "events") {
    ListEventsRequest req;
    req.set_after_sequence(argc >= 4 ? ParseU64(argv[3]) : 0);
    req.set_max_events(argc >= 5 ? ParseU64(argv[4]) : 0);

    ListEventsResponse resp;

    auto status = registry_stub->ListEvents(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& event : resp.events()) PrintJson(event);
    return 0;
  }

  Usage();
  return 1;
}
