#include <cassert>
#include <cstdint>
#include <functional>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <string>

#include "internal/core/stream_ledger.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/ledger/quality.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "streamledger/v1.hpp"

namespace {

using streamledger::core::StreamLedger;
using streamledger::util::ManualTimeSource;
using namespace streamledger::v1;

constexpr const char* kCreator   = "0xc0ffee";
constexpr const char* kViewer    = "0xbeef";
constexpr const char* kModerator = "0x0dd";

Address Addr(const std::string& value) {
  Address a;
  a.set_value(value);
  return a;
}

BlobRef Blob(const std::string& value) {
  BlobRef b;
  b.set_value(value);
  return b;
}

struct Fixture {
  std::shared_ptr<streamledger::db::memory::MemoryRepository> repository = std::make_shared<streamledger::db::memory::MemoryRepository>();
  std::shared_ptr<ManualTimeSource>                           clock      = std::make_shared<ManualTimeSource>(1'000);
  StreamLedger ledger{repository, clock, streamledger::ledger::QualityPolicy{}, kModerator};
};

StreamConfig MonetizedConfig(uint64_t price, bool tips = true) {
  StreamConfig config;
  config.set_title("speedrun");
  config.set_category("gaming");
  config.add_quality_levels(streamledger::ledger::kQuality720p);
  config.add_quality_levels(streamledger::ledger::kQuality1080p);
  config.set_is_monetized(true);
  config.set_subscription_price(price);
  config.set_tip_enabled(tips);
  return config;
}

StreamConfig FreeConfig(const std::string& category = "music") {
  StreamConfig config;
  config.set_title("open mic");
  config.set_category(category);
  config.add_quality_levels(streamledger::ledger::kQuality480p);
  return config;
}

template <typename Error>
bool Throws(const std::function<void()>& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

StreamID CreateLive(Fixture& f, const StreamConfig& config) {
  auto id = f.ledger.CreateStream(Addr(kCreator), config);
  f.ledger.StartStream(Addr(kCreator), id, Blob("manifest-1"));
  return id;
}

void TestEndToEndScenario() {
  Fixture f;

  const auto id = f.ledger.CreateStream(Addr(kCreator), MonetizedConfig(10));
  auto       s  = f.ledger.GetStream(id);
  assert(s.status() == STREAM_STATUS_CREATED);
  assert(s.revenue() == 0);
  assert(s.viewer_count() == 0);
  assert(s.moderation_score() == 100);
  assert(s.created_at_ms() == 1'000);
  assert(s.quality_levels_size() == 2);

  f.clock->Set(2'000);
  f.ledger.StartStream(Addr(kCreator), id, Blob("manifest-1"));
  s = f.ledger.GetStream(id);
  assert(s.status() == STREAM_STATUS_LIVE);
  assert(s.started_at_ms() == 2'000);
  assert(f.ledger.GetManifest(id).value() == "manifest-1");
  assert(f.ledger.IsLive(id));

  const auto joined = f.ledger.JoinStream(Addr(kViewer), id, 15);
  assert(joined.change == 0);
  s = f.ledger.GetStream(id);
  assert(s.viewer_count() == 1);
  assert(s.revenue() == 15);
  auto session = f.ledger.GetSession(joined.session);
  assert(session.has_paid());
  assert(session.quality_level() == streamledger::ledger::kQuality720p);
  assert(session.started_at_ms() == 2'000);

  f.ledger.SendTip(Addr(kViewer), id, joined.session, 5, "gg");
  assert(f.ledger.GetStream(id).revenue() == 20);
  assert(f.ledger.GetSession(joined.session).tips_sent() == 5);

  f.clock->Set(62'000);
  const auto ended = f.ledger.EndStream(Addr(kCreator), id);
  assert(ended.total_revenue() == 20);
  assert(ended.viewer_count() == 1);
  assert(ended.duration_ms() == 60'000);
  assert(f.ledger.GetStream(id).status() == STREAM_STATUS_ENDED);

  assert(f.ledger.DistributeRevenue(Addr(kCreator), id) == 20);
  assert(f.ledger.GetStream(id).revenue() == 0);
  assert(f.ledger.GetAccountBalance(Addr(kCreator)) == 20);

  const auto events = f.ledger.ListEvents(0, std::nullopt);
  assert(events.size() == 5);
  assert(events[0].has_stream_created());
  assert(events[1].has_stream_started());
  assert(events[2].has_viewer_joined());
  assert(events[3].has_tip_sent());
  assert(events[4].has_stream_ended());
  assert(events[4].stream_ended().total_revenue() == 20);
  for (size_t i = 0; i < events.size(); ++i) {
    assert(events[i].sequence() == i + 1);
  }
}

void TestStatusTransitionsRejectSkipsAndRepeats() {
  Fixture f;
  const auto id = f.ledger.CreateStream(Addr(kCreator), FreeConfig());

  assert(Throws<streamledger::util::InvalidState>([&] { f.ledger.EndStream(Addr(kCreator), id); }));
  assert(f.ledger.GetStream(id).status() == STREAM_STATUS_CREATED);

  f.ledger.StartStream(Addr(kCreator), id, Blob("m"));
  assert(Throws<streamledger::util::InvalidState>([&] { f.ledger.StartStream(Addr(kCreator), id, Blob("m2")); }));
  assert(f.ledger.GetManifest(id).value() == "m");

  f.ledger.EndStream(Addr(kCreator), id);
  assert(Throws<streamledger::util::InvalidState>([&] { f.ledger.StartStream(Addr(kCreator), id, Blob("m3")); }));
  assert(Throws<streamledger::util::InvalidState>([&] { f.ledger.EndStream(Addr(kCreator), id); }));
  assert(f.ledger.GetStream(id).status() == STREAM_STATUS_ENDED);
}

void TestOnlyCreatorMayDriveLifecycle() {
  Fixture f;
  const auto id = f.ledger.CreateStream(Addr(kCreator), FreeConfig());

  assert(Throws<streamledger::util::NotAuthorized>([&] { f.ledger.StartStream(Addr(kViewer), id, Blob("m")); }));
  f.ledger.StartStream(Addr(kCreator), id, Blob("m"));
  assert(Throws<streamledger::util::NotAuthorized>([&] { f.ledger.EndStream(Addr(kViewer), id); }));
  assert(Throws<streamledger::util::NotAuthorized>([&] { f.ledger.StoreSegment(Addr(kViewer), id, 0, Blob("seg")); }));
  assert(Throws<streamledger::util::NotAuthorized>([&] { (void)f.ledger.DistributeRevenue(Addr(kViewer), id); }));
  assert(f.ledger.IsLive(id));
}

void TestActiveStreamsTracksLiveCount() {
  Fixture f;
  const auto a = f.ledger.CreateStream(Addr(kCreator), FreeConfig());
  const auto b = f.ledger.CreateStream(Addr(kCreator), FreeConfig());
  const auto c = f.ledger.CreateStream(Addr(kCreator), FreeConfig());

  auto registry = f.ledger.GetRegistry();
  assert(registry.total_streams() == 3);
  assert(registry.active_streams() == 0);

  f.ledger.StartStream(Addr(kCreator), a, Blob("m"));
  f.ledger.StartStream(Addr(kCreator), b, Blob("m"));
  assert(f.ledger.GetRegistry().active_streams() == 2);

  f.ledger.EndStream(Addr(kCreator), a);
  assert(f.ledger.GetRegistry().active_streams() == 1);

  // failed transition leaves counters alone
  assert(Throws<streamledger::util::InvalidState>([&] { f.ledger.EndStream(Addr(kCreator), c); }));
  registry = f.ledger.GetRegistry();
  assert(registry.active_streams() == 1);
  assert(registry.total_streams() == 3);
}

void TestMonetizedJoinRequiresPrice() {
  Fixture f;
  const auto id = CreateLive(f, MonetizedConfig(10));

  assert(Throws<streamledger::util::InsufficientPayment>([&] { (void)f.ledger.JoinStream(Addr(kViewer), id, 9); }));
  auto s = f.ledger.GetStream(id);
  assert(s.revenue() == 0);
  assert(s.viewer_count() == 0);

  const auto exact = f.ledger.JoinStream(Addr(kViewer), id, 10);
  assert(f.ledger.GetSession(exact.session).has_paid());
  assert(f.ledger.GetStream(id).revenue() == 10);

  // payment stays optional; the viewer joins unpaid
  const auto unpaid = f.ledger.JoinStream(Addr("0xfree"), id, std::nullopt);
  assert(!f.ledger.GetSession(unpaid.session).has_paid());
  s = f.ledger.GetStream(id);
  assert(s.revenue() == 10);
  assert(s.viewer_count() == 2);
}

void TestPaymentToFreeStreamComesBackAsChange() {
  Fixture f;
  const auto id = CreateLive(f, FreeConfig());

  const auto joined = f.ledger.JoinStream(Addr(kViewer), id, 42);
  assert(joined.change == 42);
  assert(!f.ledger.GetSession(joined.session).has_paid());
  assert(f.ledger.GetStream(id).revenue() == 0);
  assert(f.ledger.GetStream(id).viewer_count() == 1);
}

void TestJoinNonLiveStreamAlwaysInvalidState() {
  Fixture f;
  const auto id = f.ledger.CreateStream(Addr(kCreator), MonetizedConfig(10));

  assert(Throws<streamledger::util::InvalidState>([&] { (void)f.ledger.JoinStream(Addr(kViewer), id, 1); }));
  assert(Throws<streamledger::util::InvalidState>([&] { (void)f.ledger.JoinStream(Addr(kViewer), id, 100); }));
  assert(Throws<streamledger::util::InvalidState>([&] { (void)f.ledger.JoinStream(Addr(kViewer), id, std::nullopt); }));

  f.ledger.StartStream(Addr(kCreator), id, Blob("m"));
  f.ledger.EndStream(Addr(kCreator), id);
  assert(Throws<streamledger::util::InvalidState>([&] { (void)f.ledger.JoinStream(Addr(kViewer), id, 5); }));
  assert(f.ledger.GetStream(id).viewer_count() == 0);
}

void TestHeartbeatAccumulatesWatchTime() {
  Fixture f;
  const auto id     = CreateLive(f, FreeConfig());
  const auto joined = f.ledger.JoinStream(Addr(kViewer), id, std::nullopt);

  f.clock->Advance(3'000);
  f.ledger.UpdateHeartbeat(Addr(kViewer), joined.session, streamledger::ledger::kQuality4k);
  f.clock->Advance(2'000);
  f.ledger.UpdateHeartbeat(Addr(kViewer), joined.session, streamledger::ledger::kQuality240p);

  const auto session = f.ledger.GetSession(joined.session);
  assert(session.total_watch_time_ms() == 5'000);
  assert(session.quality_level() == streamledger::ledger::kQuality240p);
  assert(session.last_heartbeat_ms() == f.clock->NowMs());

  assert(Throws<streamledger::util::InvalidQuality>(
      [&] { f.ledger.UpdateHeartbeat(Addr(kViewer), joined.session, streamledger::ledger::kQuality4k + 1); }));
  assert(Throws<streamledger::util::NotAuthorized>([&] { f.ledger.UpdateHeartbeat(Addr(kCreator), joined.session, 1); }));

  SessionID missing;
  missing.set_value("0xmissing");
  assert(Throws<streamledger::util::NotFound>([&] { f.ledger.UpdateHeartbeat(Addr(kViewer), missing, 1); }));
  assert(f.ledger.GetSession(joined.session).total_watch_time_ms() == 5'000);
}

void TestTipValidation() {
  Fixture f;
  const auto tipping  = CreateLive(f, MonetizedConfig(1, true));
  const auto no_tips  = CreateLive(f, MonetizedConfig(1, false));
  const auto session  = f.ledger.JoinStream(Addr(kViewer), tipping, 1).session;
  const auto other    = f.ledger.JoinStream(Addr(kViewer), no_tips, 1).session;

  assert(Throws<streamledger::util::InvalidState>([&] { f.ledger.SendTip(Addr(kViewer), no_tips, other, 5, ""); }));
  assert(Throws<streamledger::util::NotAuthorized>([&] { f.ledger.SendTip(Addr(kCreator), tipping, session, 5, ""); }));
  assert(Throws<streamledger::util::InvalidArgument>([&] { f.ledger.SendTip(Addr(kViewer), tipping, other, 5, ""); }));
  assert(Throws<streamledger::util::InvalidArgument>([&] { f.ledger.SendTip(Addr(kViewer), tipping, session, 0, ""); }));
  assert(f.ledger.GetStream(tipping).revenue() == 1);

  // tips bypass the subscription floor
  f.ledger.SendTip(Addr(kViewer), tipping, session, 1, "small");
  f.ledger.SendTip(Addr(kViewer), tipping, session, 1'000, "big");
  assert(f.ledger.GetStream(tipping).revenue() == 1'002);
  assert(f.ledger.GetSession(session).tips_sent() == 1'001);
}

void TestTipOverflowIsAtomic() {
  Fixture f;
  const auto id      = CreateLive(f, MonetizedConfig(1, true));
  const auto session = f.ledger.JoinStream(Addr(kViewer), id, std::numeric_limits<uint64_t>::max() - 1).session;
  const auto before  = f.ledger.ListEvents(0, std::nullopt).size();

  assert(Throws<streamledger::util::Overflow>([&] { f.ledger.SendTip(Addr(kViewer), id, session, 2, ""); }));
  assert(f.ledger.GetStream(id).revenue() == std::numeric_limits<uint64_t>::max() - 1);
  assert(f.ledger.GetSession(session).tips_sent() == 0);
  assert(f.ledger.ListEvents(0, std::nullopt).size() == before);
}

void TestDistributeRevenue() {
  Fixture f;
  const auto id = CreateLive(f, MonetizedConfig(10));

  assert(f.ledger.DistributeRevenue(Addr(kCreator), id) == 0);
  assert(f.ledger.GetAccountBalance(Addr(kCreator)) == 0);

  (void)f.ledger.JoinStream(Addr(kViewer), id, 30);
  assert(f.ledger.DistributeRevenue(Addr(kCreator), id) == 30);
  assert(f.ledger.GetStream(id).revenue() == 0);

  (void)f.ledger.JoinStream(Addr("0xsecond"), id, 12);
  assert(f.ledger.DistributeRevenue(Addr(kCreator), id) == 12);
  assert(f.ledger.GetAccountBalance(Addr(kCreator)) == 42);
  assert(f.ledger.DistributeRevenue(Addr(kCreator), id) == 0);
}

void TestDuplicateSegmentKeepsFirstBlob() {
  Fixture f;
  const auto id = f.ledger.CreateStream(Addr(kCreator), FreeConfig());

  // segments are accepted before the stream goes live
  f.ledger.StoreSegment(Addr(kCreator), id, 0, Blob("first"));
  assert(Throws<streamledger::util::AlreadyExists>([&] { f.ledger.StoreSegment(Addr(kCreator), id, 0, Blob("second")); }));
  assert(f.ledger.GetSegment(id, 0).blob().value() == "first");

  f.ledger.StoreSegment(Addr(kCreator), id, 7, Blob("seventh"));
  assert(f.ledger.GetStream(id).segment_count() == 2);
  assert(Throws<streamledger::util::NotFound>([&] { (void)f.ledger.GetSegment(id, 1); }));

  const auto events = f.ledger.ListEvents(0, std::nullopt);
  assert(events.size() == 3);
  assert(events[1].segment_stored().blob().value() == "first");
  assert(events[2].segment_stored().segment_number() == 7);
}

void TestCreateValidatesQualityAndSplits() {
  Fixture f;

  auto config = FreeConfig();
  config.add_quality_levels(streamledger::ledger::kQuality4k);
  (void)f.ledger.CreateStream(Addr(kCreator), config);

  config.add_quality_levels(streamledger::ledger::kQuality4k + 1);
  assert(Throws<streamledger::util::InvalidQuality>([&] { (void)f.ledger.CreateStream(Addr(kCreator), config); }));

  StreamConfig empty_tiers = FreeConfig();
  empty_tiers.clear_quality_levels();
  assert(Throws<streamledger::util::InvalidArgument>([&] { (void)f.ledger.CreateStream(Addr(kCreator), empty_tiers); }));

  StreamConfig bad_split = FreeConfig();
  auto*        split     = bad_split.add_revenue_splits();
  split->mutable_recipient()->set_value("0xa");
  split->set_basis_points(10'001);
  assert(Throws<streamledger::util::InvalidArgument>([&] { (void)f.ledger.CreateStream(Addr(kCreator), bad_split); }));

  assert(Throws<streamledger::util::InvalidArgument>([&] { (void)f.ledger.CreateStream(Addr(""), FreeConfig()); }));

  assert(f.ledger.GetRegistry().total_streams() == 1);
  assert(f.ledger.ListEvents(0, std::nullopt).size() == 1);
}

void TestCategoryIndexKeepsCreationOrder() {
  Fixture f;
  const auto a = f.ledger.CreateStream(Addr(kCreator), FreeConfig("jazz"));
  const auto b = f.ledger.CreateStream(Addr(kCreator), FreeConfig("rock"));
  const auto c = f.ledger.CreateStream(Addr(kCreator), FreeConfig("jazz"));

  const auto jazz = f.ledger.ListCategory("jazz");
  assert(jazz.size() == 2);
  assert(jazz[0].value() == a.value());
  assert(jazz[1].value() == c.value());
  assert(f.ledger.ListCategory("rock")[0].value() == b.value());
  assert(f.ledger.ListCategory("polka").empty());
}

void TestModerationScore() {
  Fixture f;
  const auto id = f.ledger.CreateStream(Addr(kCreator), FreeConfig());

  assert(Throws<streamledger::util::NotAuthorized>([&] { f.ledger.SetModerationScore(Addr(kCreator), id, 10); }));
  assert(Throws<streamledger::util::InvalidArgument>([&] { f.ledger.SetModerationScore(Addr(kModerator), id, 101); }));
  f.ledger.SetModerationScore(Addr(kModerator), id, 40);
  assert(f.ledger.GetStream(id).moderation_score() == 40);
  assert(f.ledger.ListEvents(0, std::nullopt).size() == 1);

  StreamLedger unmoderated(std::make_shared<streamledger::db::memory::MemoryRepository>(), f.clock);
  const auto   other = unmoderated.CreateStream(Addr(kCreator), FreeConfig());
  assert(Throws<streamledger::util::NotAuthorized>([&] { unmoderated.SetModerationScore(Addr(""), other, 10); }));
}

void TestAccessorsOnUnknownIds() {
  Fixture  f;
  StreamID missing;
  missing.set_value("0xnope");

  assert(Throws<streamledger::util::NotFound>([&] { (void)f.ledger.GetStream(missing); }));
  assert(Throws<streamledger::util::NotFound>([&] { (void)f.ledger.IsLive(missing); }));
  assert(Throws<streamledger::util::NotFound>([&] { f.ledger.StartStream(Addr(kCreator), missing, Blob("m")); }));
  assert(f.ledger.GetAccountBalance(Addr("0xnobody")) == 0);

  const auto id = f.ledger.CreateStream(Addr(kCreator), MonetizedConfig(25, false));
  assert(f.ledger.IsMonetized(id));
  assert(f.ledger.SubscriptionPrice(id) == 25);
  assert(!f.ledger.TipEnabled(id));
  assert(!f.ledger.IsLive(id));
}

void TestEventPaging() {
  Fixture f;
  for (int i = 0; i < 5; ++i) {
    (void)f.ledger.CreateStream(Addr(kCreator), FreeConfig());
  }

  const auto page = f.ledger.ListEvents(2, 2);
  assert(page.size() == 2);
  assert(page[0].sequence() == 3);
  assert(page[1].sequence() == 4);
  assert(f.ledger.ListEvents(5, std::nullopt).empty());
  assert(f.ledger.ListEvents(0, 0).empty());
}

void TestSessionTierComesFromPolicy() {
  auto clock = std::make_shared<ManualTimeSource>(0);
  StreamLedger ledger(std::make_shared<streamledger::db::memory::MemoryRepository>(), clock,
                      streamledger::ledger::QualityPolicy{.max_tier = 3, .session_tier = 1});

  const auto id = ledger.CreateStream(Addr(kCreator), FreeConfig());
  ledger.StartStream(Addr(kCreator), id, Blob("m"));
  const auto session = ledger.JoinStream(Addr(kViewer), id, std::nullopt).session;
  assert(ledger.GetSession(session).quality_level() == 1);
  assert(Throws<streamledger::util::InvalidQuality>([&] { ledger.UpdateHeartbeat(Addr(kViewer), session, 4); }));

  assert(Throws<streamledger::util::InvalidQuality>([&] {
    StreamLedger bad(std::make_shared<streamledger::db::memory::MemoryRepository>(), clock,
                     streamledger::ledger::QualityPolicy{.max_tier = 1, .session_tier = 2});
  }));
}

} // namespace

int main() {
  TestEndToEndScenario();
  TestStatusTransitionsRejectSkipsAndRepeats();
  TestOnlyCreatorMayDriveLifecycle();
  TestActiveStreamsTracksLiveCount();
  TestMonetizedJoinRequiresPrice();
  TestPaymentToFreeStreamComesBackAsChange();
  TestJoinNonLiveStreamAlwaysInvalidState();
  TestHeartbeatAccumulatesWatchTime();
  TestTipValidation();
  TestTipOverflowIsAtomic();
  TestDistributeRevenue();
  TestDuplicateSegmentKeepsFirstBlob();
  TestCreateValidatesQualityAndSplits();
  TestCategoryIndexKeepsCreationOrder();
  TestModerationScore();
  TestAccessorsOnUnknownIds();
  TestEventPaging();
  TestSessionTierComesFromPolicy();

  std::cout << "streamledger_unit_stream_ledger: pass\n";
  return 0;
}
