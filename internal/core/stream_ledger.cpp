#include "stream_ledger.hpp"

#include <mutex>
#include <stdexcept>

#include "internal/ledger/balance.hpp"
#include "internal/ledger/revenue_split.hpp"
#include "internal/model/stream_status.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/object_id.hpp"

namespace streamledger::core {

using namespace streamledger::v1;
using Status = streamledger::model::StreamStatus;
using streamledger::observability::StringField;
using streamledger::observability::UIntField;

namespace {

void ThrowIfDbError(const streamledger::db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case streamledger::db::ErrorCode::AlreadyExists:
      throw streamledger::util::AlreadyExists(message);
    case streamledger::db::ErrorCode::NotFound:
      throw streamledger::util::NotFound(message);
    case streamledger::db::ErrorCode::Conflict:
      throw streamledger::util::InvalidState(message);
    default:
      throw std::runtime_error(message);
  }
}

void RequireSender(const Address& sender, const char* op) {
  if (sender.value().empty()) {
    throw streamledger::util::InvalidArgument(std::string(op) + ": sender address is required");
  }
}

void RequireCreator(const Address& sender, const db::model::StreamRecord& record, const char* op) {
  if (sender.value() != record.creator) {
    throw streamledger::util::NotAuthorized(std::string(op) + ": only the stream creator may do this");
  }
}

void Transition(db::model::StreamRecord& record, Status to, const char* op) {
  if (!streamledger::model::CanTransition(record.status, to)) {
    throw streamledger::util::InvalidState(std::string(op) + ": stream is " + std::string(streamledger::model::ToString(record.status)));
  }
  record.status = to;
}

streamledger::v1::StreamStatus ToProtoStatus(Status status) {
  switch (status) {
    case Status::kCreated:
      return STREAM_STATUS_CREATED;
    case Status::kLive:
      return STREAM_STATUS_LIVE;
    case Status::kEnded:
      return STREAM_STATUS_ENDED;
    case Status::kArchived:
      return STREAM_STATUS_ARCHIVED;
  }
  return STREAM_STATUS_UNSPECIFIED;
}

StreamSummary ToStreamSummary(const db::model::StreamRecord& record, uint64_t segment_count) {
  StreamSummary summary;
  summary.mutable_id()->set_value(record.id);
  summary.mutable_creator()->set_value(record.creator);
  summary.set_title(record.title);
  summary.set_description(record.description);
  summary.set_category(record.category);
  summary.set_content_rating(record.content_rating);
  for (const auto& tag : record.tags) {
    summary.add_tags(tag);
  }
  summary.mutable_thumbnail()->set_value(record.thumbnail_ref);
  summary.mutable_manifest()->set_value(record.manifest_ref);
  summary.set_status(ToProtoStatus(record.status));
  summary.set_created_at_ms(record.created_at_ms);
  summary.set_started_at_ms(record.started_at_ms);
  summary.set_ended_at_ms(record.ended_at_ms);
  summary.set_viewer_count(record.viewer_count);
  summary.set_revenue(record.revenue);
  for (const auto level : record.quality_levels) {
    summary.add_quality_levels(level);
  }
  summary.set_is_monetized(record.is_monetized);
  summary.set_subscription_price(record.subscription_price);
  summary.set_tip_enabled(record.tip_enabled);
  summary.set_moderation_score(record.moderation_score);
  for (const auto& [recipient, bps] : record.revenue_splits) {
    auto* split = summary.add_revenue_splits();
    split->mutable_recipient()->set_value(recipient);
    split->set_basis_points(bps);
  }
  summary.set_segment_count(segment_count);
  return summary;
}

SessionSummary ToSessionSummary(const db::model::ViewerSessionRecord& record) {
  SessionSummary summary;
  summary.mutable_id()->set_value(record.id);
  summary.mutable_stream()->set_value(record.stream_id);
  summary.mutable_viewer()->set_value(record.viewer);
  summary.set_started_at_ms(record.started_at_ms);
  summary.set_last_heartbeat_ms(record.last_heartbeat_ms);
  summary.set_total_watch_time_ms(record.total_watch_time_ms);
  summary.set_quality_level(record.quality_level);
  summary.set_has_paid(record.has_paid);
  summary.set_tips_sent(record.tips_sent);
  return summary;
}

} // namespace

StreamLedger::StreamLedger(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::TimeSource> clock, ledger::QualityPolicy quality,
                           std::string moderator_address)
    : repository_(std::move(repository)),
      clock_(std::move(clock)),
      quality_(quality),
      moderator_address_(std::move(moderator_address)),
      journal_(std::make_unique<events::EventJournal>(repository_)) {
  if (!repository_) throw std::invalid_argument("stream ledger: repository is required");
  if (!clock_) throw std::invalid_argument("stream ledger: time source is required");
  ledger::ValidateTier(quality_, quality_.session_tier);
}

db::model::StreamRecord StreamLedger::LoadStream(db::Transaction& tx, const StreamID& stream) const {
  auto record = repository_->GetStream(tx, stream.value());
  if (!record.has_value()) throw util::NotFound("stream not found: " + stream.value());
  return std::move(*record);
}

db::model::ViewerSessionRecord StreamLedger::LoadSession(db::Transaction& tx, const SessionID& session) const {
  auto record = repository_->GetSession(tx, session.value());
  if (!record.has_value()) throw util::NotFound("session not found: " + session.value());
  return std::move(*record);
}

// ---------------------------------------------------------------------------
// Stream lifecycle
// ---------------------------------------------------------------------------

StreamID StreamLedger::CreateStream(const Address& sender, const StreamConfig& config) {
  RequireSender(sender, "create stream");

  const std::vector<uint32_t> requested(config.quality_levels().begin(), config.quality_levels().end());
  auto                        tiers = ledger::NormalizeTiers(quality_, requested);

  std::vector<std::pair<std::string, uint32_t>> split_entries;
  split_entries.reserve(config.revenue_splits_size());
  for (const auto& split : config.revenue_splits()) {
    split_entries.emplace_back(split.recipient().value(), split.basis_points());
  }
  auto splits = ledger::BuildRevenueSplits(split_entries);

  std::unique_lock lock(mutex_);
  const auto       now = clock_->NowMs();

  db::model::StreamRecord record;
  record.id                 = util::ToString(util::GenerateObjectID());
  record.creator            = sender.value();
  record.title              = config.title();
  record.description        = config.description();
  record.category           = config.category();
  record.content_rating     = config.content_rating();
  record.thumbnail_ref      = config.thumbnail().value();
  record.status             = Status::kCreated;
  record.created_at_ms      = now;
  record.quality_levels     = std::move(tiers);
  record.revenue_splits     = std::move(splits);
  record.is_monetized       = config.is_monetized();
  record.subscription_price = config.subscription_price();
  record.tip_enabled        = config.tip_enabled();
  record.tags.assign(config.tags().begin(), config.tags().end());

  auto tx       = repository_->Begin();
  auto registry = repository_->GetRegistry(*tx);
  registry.total_streams = ledger::CheckedAdd(registry.total_streams, 1, "registry total_streams");

  ThrowIfDbError(repository_->InsertStream(*tx, record), "create stream");
  ThrowIfDbError(repository_->PutRegistry(*tx, registry), "create stream registry");
  ThrowIfDbError(repository_->AppendCategoryEntry(*tx, record.category, record.id), "create stream category");

  LedgerEvent event;
  auto*       created = event.mutable_stream_created();
  created->mutable_stream()->set_value(record.id);
  created->mutable_creator()->set_value(record.creator);
  created->set_title(record.title);
  created->set_category(record.category);
  created->set_created_at_ms(now);
  journal_->Append(*tx, event, now);

  tx->Commit();

  STREAMLEDGER_LOG_INFO("stream created",
                        {StringField("stream", record.id), StringField("creator", record.creator), StringField("category", record.category)});

  StreamID id;
  id.set_value(record.id);
  return id;
}

void StreamLedger::StartStream(const Address& sender, const StreamID& stream, const BlobRef& manifest) {
  std::unique_lock lock(mutex_);
  auto             tx     = repository_->Begin();
  auto             record = LoadStream(*tx, stream);
  RequireCreator(sender, record, "start stream");
  Transition(record, Status::kLive, "start stream");

  const auto now       = clock_->NowMs();
  record.started_at_ms = now;
  record.manifest_ref  = manifest.value();

  auto registry           = repository_->GetRegistry(*tx);
  registry.active_streams = ledger::CheckedAdd(registry.active_streams, 1, "registry active_streams");

  ThrowIfDbError(repository_->UpdateStream(*tx, record), "start stream");
  ThrowIfDbError(repository_->PutRegistry(*tx, registry), "start stream registry");

  LedgerEvent event;
  auto*       started = event.mutable_stream_started();
  started->mutable_stream()->set_value(record.id);
  started->mutable_creator()->set_value(record.creator);
  started->mutable_manifest()->set_value(record.manifest_ref);
  started->set_started_at_ms(now);
  journal_->Append(*tx, event, now);

  tx->Commit();

  observability::Metrics::Instance().SetActiveStreams(registry.active_streams);
  STREAMLEDGER_LOG_INFO("stream started", {StringField("stream", record.id), StringField("manifest", record.manifest_ref)});
}

StreamEnded StreamLedger::EndStream(const Address& sender, const StreamID& stream) {
  std::unique_lock lock(mutex_);
  auto             tx     = repository_->Begin();
  auto             record = LoadStream(*tx, stream);
  RequireCreator(sender, record, "end stream");
  Transition(record, Status::kEnded, "end stream");

  const auto now     = clock_->NowMs();
  record.ended_at_ms = now;

  auto registry = repository_->GetRegistry(*tx);
  if (registry.active_streams == 0) {
    throw std::runtime_error("end stream: registry has no active streams");
  }
  registry.active_streams--;

  ThrowIfDbError(repository_->UpdateStream(*tx, record), "end stream");
  ThrowIfDbError(repository_->PutRegistry(*tx, registry), "end stream registry");

  LedgerEvent event;
  auto*       ended = event.mutable_stream_ended();
  ended->mutable_stream()->set_value(record.id);
  ended->set_duration_ms(record.ended_at_ms >= record.started_at_ms ? record.ended_at_ms - record.started_at_ms : 0);
  ended->set_viewer_count(record.viewer_count);
  ended->set_total_revenue(record.revenue);
  ended->set_ended_at_ms(now);
  journal_->Append(*tx, event, now);

  tx->Commit();

  observability::Metrics::Instance().SetActiveStreams(registry.active_streams);
  STREAMLEDGER_LOG_INFO("stream ended", {StringField("stream", record.id), UIntField("duration_ms", ended->duration_ms()),
                                         UIntField("viewers", record.viewer_count), UIntField("revenue", record.revenue)});
  return *ended;
}

void StreamLedger::StoreSegment(const Address& sender, const StreamID& stream, uint64_t segment_number, const BlobRef& blob) {
  std::unique_lock lock(mutex_);
  auto             tx     = repository_->Begin();
  const auto       record = LoadStream(*tx, stream);
  RequireCreator(sender, record, "store segment");

  const auto           now = clock_->NowMs();
  db::model::SegmentRecord segment;
  segment.stream_id      = record.id;
  segment.segment_number = segment_number;
  segment.blob_ref       = blob.value();
  segment.stored_at_ms   = now;
  ThrowIfDbError(repository_->InsertSegment(*tx, segment), "store segment " + std::to_string(segment_number));

  LedgerEvent event;
  auto*       stored = event.mutable_segment_stored();
  stored->mutable_stream()->set_value(record.id);
  stored->set_segment_number(segment_number);
  stored->mutable_blob()->set_value(segment.blob_ref);
  stored->set_stored_at_ms(now);
  journal_->Append(*tx, event, now);

  tx->Commit();

  STREAMLEDGER_LOG_INFO("segment stored", {StringField("stream", record.id), UIntField("segment", segment_number)});
}

void StreamLedger::SetModerationScore(const Address& sender, const StreamID& stream, uint32_t score) {
  if (moderator_address_.empty() || sender.value() != moderator_address_) {
    throw util::NotAuthorized("set moderation score: caller is not the moderator");
  }
  if (score > 100) {
    throw util::InvalidArgument("set moderation score: score must be within 0..100");
  }

  std::unique_lock lock(mutex_);
  auto             tx     = repository_->Begin();
  auto             record = LoadStream(*tx, stream);
  record.moderation_score = score;
  ThrowIfDbError(repository_->UpdateStream(*tx, record), "set moderation score");
  tx->Commit();

  STREAMLEDGER_LOG_INFO("moderation score updated", {StringField("stream", record.id), UIntField("score", score)});
}

// ---------------------------------------------------------------------------
// Viewers
// ---------------------------------------------------------------------------

StreamLedger::JoinResult StreamLedger::JoinStream(const Address& sender, const StreamID& stream, std::optional<uint64_t> payment) {
  RequireSender(sender, "join stream");

  std::unique_lock lock(mutex_);
  auto             tx     = repository_->Begin();
  auto             record = LoadStream(*tx, stream);
  if (record.status != Status::kLive) {
    throw util::InvalidState("join stream: stream is " + std::string(streamledger::model::ToString(record.status)));
  }

  JoinResult result;
  uint64_t   amount_paid = 0;
  bool       paid        = false;
  if (payment.has_value()) {
    if (record.is_monetized) {
      if (*payment < record.subscription_price) {
        throw util::InsufficientPayment("join stream: payment " + std::to_string(*payment) + " is below subscription price " +
                                        std::to_string(record.subscription_price));
      }
      ledger::Balance balance(record.revenue);
      balance.Deposit(*payment);
      record.revenue = balance.Value();
      amount_paid    = *payment;
      paid           = true;
    } else {
      result.change = *payment;
    }
  }
  record.viewer_count = ledger::CheckedAdd(record.viewer_count, 1, "viewer_count");

  const auto                     now = clock_->NowMs();
  db::model::ViewerSessionRecord session;
  session.id                = util::ToString(util::GenerateObjectID());
  session.stream_id         = record.id;
  session.viewer            = sender.value();
  session.started_at_ms     = now;
  session.last_heartbeat_ms = now;
  session.quality_level     = quality_.session_tier;
  session.has_paid          = paid;

  ThrowIfDbError(repository_->UpdateStream(*tx, record), "join stream");
  ThrowIfDbError(repository_->InsertSession(*tx, session), "join stream session");

  LedgerEvent event;
  auto*       joined = event.mutable_viewer_joined();
  joined->mutable_stream()->set_value(record.id);
  joined->mutable_session()->set_value(session.id);
  joined->mutable_viewer()->set_value(session.viewer);
  joined->set_paid(paid);
  joined->set_amount_paid(amount_paid);
  joined->set_joined_at_ms(now);
  journal_->Append(*tx, event, now);

  tx->Commit();

  observability::Metrics::Instance().RecordRevenue("subscription", amount_paid);
  STREAMLEDGER_LOG_INFO("viewer joined", {StringField("stream", record.id), StringField("session", session.id),
                                          StringField("viewer", session.viewer), UIntField("paid", amount_paid)});

  result.session.set_value(session.id);
  return result;
}

void StreamLedger::UpdateHeartbeat(const Address& sender, const SessionID& session_id, uint32_t quality_level) {
  std::unique_lock lock(mutex_);
  auto             tx      = repository_->Begin();
  auto             session = LoadSession(*tx, session_id);
  if (sender.value() != session.viewer) {
    throw util::NotAuthorized("update heartbeat: session belongs to another viewer");
  }
  ledger::ValidateTier(quality_, quality_level);

  const auto now     = clock_->NowMs();
  const auto elapsed = now > session.last_heartbeat_ms ? now - session.last_heartbeat_ms : 0;
  session.total_watch_time_ms = ledger::CheckedAdd(session.total_watch_time_ms, elapsed, "total_watch_time_ms");
  session.last_heartbeat_ms   = now;
  session.quality_level       = quality_level;

  ThrowIfDbError(repository_->UpdateSession(*tx, session), "update heartbeat");
  tx->Commit();

  STREAMLEDGER_LOG_INFO("heartbeat", {StringField("session", session.id), UIntField("watch_time_ms", session.total_watch_time_ms),
                                      UIntField("quality", quality_level)});
}

void StreamLedger::SendTip(const Address& sender, const StreamID& stream, const SessionID& session_id, uint64_t amount,
                           const std::string& message) {
  std::unique_lock lock(mutex_);
  auto             tx     = repository_->Begin();
  auto             record = LoadStream(*tx, stream);
  if (!record.tip_enabled) {
    throw util::InvalidState("send tip: tips are disabled for this stream");
  }

  auto session = LoadSession(*tx, session_id);
  if (sender.value() != session.viewer) {
    throw util::NotAuthorized("send tip: session belongs to another viewer");
  }
  if (session.stream_id != record.id) {
    throw util::InvalidArgument("send tip: session was opened on a different stream");
  }
  if (amount == 0) {
    throw util::InvalidArgument("send tip: amount must be positive");
  }

  ledger::Balance balance(record.revenue);
  balance.Deposit(amount);
  record.revenue    = balance.Value();
  session.tips_sent = ledger::CheckedAdd(session.tips_sent, amount, "tips_sent");

  ThrowIfDbError(repository_->UpdateStream(*tx, record), "send tip");
  ThrowIfDbError(repository_->UpdateSession(*tx, session), "send tip session");

  const auto  now = clock_->NowMs();
  LedgerEvent event;
  auto*       tip = event.mutable_tip_sent();
  tip->mutable_stream()->set_value(record.id);
  tip->mutable_sender()->set_value(sender.value());
  tip->mutable_creator()->set_value(record.creator);
  tip->set_amount(amount);
  tip->set_message(message);
  tip->set_sent_at_ms(now);
  journal_->Append(*tx, event, now);

  tx->Commit();

  observability::Metrics::Instance().RecordRevenue("tip", amount);
  STREAMLEDGER_LOG_INFO("tip sent", {StringField("stream", record.id), StringField("session", session.id), UIntField("amount", amount)});
}

// ---------------------------------------------------------------------------
// Revenue
// ---------------------------------------------------------------------------

uint64_t StreamLedger::DistributeRevenue(const Address& sender, const StreamID& stream) {
  std::unique_lock lock(mutex_);
  auto             tx     = repository_->Begin();
  auto             record = LoadStream(*tx, stream);
  RequireCreator(sender, record, "distribute revenue");

  if (record.revenue == 0) {
    tx->Rollback();
    return 0;
  }

  ledger::Balance balance(record.revenue);
  const auto      amount = balance.WithdrawAll();
  record.revenue         = balance.Value();

  db::model::AccountRecord account;
  account.address = record.creator;
  if (auto existing = repository_->GetAccount(*tx, record.creator)) {
    account = std::move(*existing);
  }
  ledger::Balance payout(account.balance);
  payout.Deposit(amount);
  account.balance = payout.Value();

  ThrowIfDbError(repository_->UpdateStream(*tx, record), "distribute revenue");
  ThrowIfDbError(repository_->UpsertAccount(*tx, account), "distribute revenue account");
  tx->Commit();

  observability::Metrics::Instance().RecordRevenue("payout", amount);
  STREAMLEDGER_LOG_INFO("revenue distributed", {StringField("stream", record.id), StringField("creator", record.creator), UIntField("amount", amount)});
  return amount;
}

// ---------------------------------------------------------------------------
// Accessors
// ---------------------------------------------------------------------------

StreamSummary StreamLedger::GetStream(const StreamID& stream) const {
  std::shared_lock lock(mutex_);
  auto             tx       = repository_->Begin();
  const auto       record   = LoadStream(*tx, stream);
  const auto       segments = repository_->CountSegments(*tx, record.id);
  tx->Commit();
  return ToStreamSummary(record, segments);
}

BlobRef StreamLedger::GetManifest(const StreamID& stream) const {
  std::shared_lock lock(mutex_);
  auto             tx     = repository_->Begin();
  const auto       record = LoadStream(*tx, stream);
  tx->Commit();

  BlobRef manifest;
  manifest.set_value(record.manifest_ref);
  return manifest;
}

Segment StreamLedger::GetSegment(const StreamID& stream, uint64_t segment_number) const {
  std::shared_lock lock(mutex_);
  auto             tx      = repository_->Begin();
  auto             segment = repository_->GetSegment(*tx, stream.value(), segment_number);
  tx->Commit();
  if (!segment.has_value()) {
    throw util::NotFound("segment " + std::to_string(segment_number) + " not found on stream " + stream.value());
  }

  Segment out;
  out.mutable_stream()->set_value(segment->stream_id);
  out.set_segment_number(segment->segment_number);
  out.mutable_blob()->set_value(segment->blob_ref);
  out.set_stored_at_ms(segment->stored_at_ms);
  return out;
}

bool StreamLedger::IsLive(const StreamID& stream) const {
  return GetStream(stream).status() == STREAM_STATUS_LIVE;
}

bool StreamLedger::IsMonetized(const StreamID& stream) const {
  return GetStream(stream).is_monetized();
}

uint64_t StreamLedger::SubscriptionPrice(const StreamID& stream) const {
  return GetStream(stream).subscription_price();
}

bool StreamLedger::TipEnabled(const StreamID& stream) const {
  return GetStream(stream).tip_enabled();
}

SessionSummary StreamLedger::GetSession(const SessionID& session) const {
  std::shared_lock lock(mutex_);
  auto             tx     = repository_->Begin();
  const auto       record = LoadSession(*tx, session);
  tx->Commit();
  return ToSessionSummary(record);
}

RegistrySummary StreamLedger::GetRegistry() const {
  std::shared_lock lock(mutex_);
  auto             tx       = repository_->Begin();
  const auto       registry = repository_->GetRegistry(*tx);
  tx->Commit();

  RegistrySummary summary;
  summary.set_total_streams(registry.total_streams);
  summary.set_active_streams(registry.active_streams);
  return summary;
}

std::vector<StreamID> StreamLedger::ListCategory(const std::string& category) const {
  std::shared_lock lock(mutex_);
  auto             tx      = repository_->Begin();
  const auto       entries = repository_->ListCategory(*tx, category);
  tx->Commit();

  std::vector<StreamID> ids;
  ids.reserve(entries.size());
  for (const auto& entry : entries) {
    StreamID id;
    id.set_value(entry.stream_id);
    ids.push_back(std::move(id));
  }
  return ids;
}

uint64_t StreamLedger::GetAccountBalance(const Address& address) const {
  std::shared_lock lock(mutex_);
  auto             tx      = repository_->Begin();
  const auto       account = repository_->GetAccount(*tx, address.value());
  tx->Commit();
  return account.has_value() ? account->balance : 0;
}

std::vector<LedgerEvent> StreamLedger::ListEvents(uint64_t after_sequence, std::optional<uint64_t> max_events) const {
  std::shared_lock lock(mutex_);
  auto             tx     = repository_->Begin();
  auto             events = journal_->List(*tx, after_sequence, max_events);
  tx->Commit();
  return events;
}

} // namespace streamledger::core
