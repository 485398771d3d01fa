#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/events/event_journal.hpp"
#include "internal/ledger/quality.hpp"
#include "internal/util/time.hpp"
#include "streamledger/v1.hpp"

namespace streamledger::core {

/*
  Streaming ledger core.

  Every mutating entry point runs in one repository transaction under the
  ledger-wide writer lock: it either commits all of its effects (state, the
  registry counters and its journal event) or throws a util:: error and leaves
  nothing behind. Accessors take the lock shared and never write.
*/
class StreamLedger {
 public:
  struct JoinResult {
    streamledger::v1::SessionID session;
    // payment handed back when the stream is not monetized
    uint64_t change = 0;
  };

  StreamLedger(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::TimeSource> clock,
               ledger::QualityPolicy quality = {}, std::string moderator_address = {});

  // Stream lifecycle
  streamledger::v1::StreamID    CreateStream(const streamledger::v1::Address& sender, const streamledger::v1::StreamConfig& config);
  void                          StartStream(const streamledger::v1::Address& sender, const streamledger::v1::StreamID& stream,
                                            const streamledger::v1::BlobRef& manifest);
  streamledger::v1::StreamEnded EndStream(const streamledger::v1::Address& sender, const streamledger::v1::StreamID& stream);
  void StoreSegment(const streamledger::v1::Address& sender, const streamledger::v1::StreamID& stream, uint64_t segment_number,
                    const streamledger::v1::BlobRef& blob);
  void SetModerationScore(const streamledger::v1::Address& sender, const streamledger::v1::StreamID& stream, uint32_t score);

  // Viewers
  JoinResult JoinStream(const streamledger::v1::Address& sender, const streamledger::v1::StreamID& stream, std::optional<uint64_t> payment);
  void UpdateHeartbeat(const streamledger::v1::Address& sender, const streamledger::v1::SessionID& session, uint32_t quality_level);
  void SendTip(const streamledger::v1::Address& sender, const streamledger::v1::StreamID& stream, const streamledger::v1::SessionID& session,
               uint64_t amount, const std::string& message);

  // Revenue
  uint64_t DistributeRevenue(const streamledger::v1::Address& sender, const streamledger::v1::StreamID& stream);

  // Accessors
  streamledger::v1::StreamSummary   GetStream(const streamledger::v1::StreamID& stream) const;
  streamledger::v1::BlobRef         GetManifest(const streamledger::v1::StreamID& stream) const;
  streamledger::v1::Segment         GetSegment(const streamledger::v1::StreamID& stream, uint64_t segment_number) const;
  bool                              IsLive(const streamledger::v1::StreamID& stream) const;
  bool                              IsMonetized(const streamledger::v1::StreamID& stream) const;
  uint64_t                          SubscriptionPrice(const streamledger::v1::StreamID& stream) const;
  bool                              TipEnabled(const streamledger::v1::StreamID& stream) const;
  streamledger::v1::SessionSummary  GetSession(const streamledger::v1::SessionID& session) const;
  streamledger::v1::RegistrySummary GetRegistry() const;
  std::vector<streamledger::v1::StreamID>    ListCategory(const std::string& category) const;
  uint64_t                                   GetAccountBalance(const streamledger::v1::Address& address) const;
  std::vector<streamledger::v1::LedgerEvent> ListEvents(uint64_t after_sequence, std::optional<uint64_t> max_events) const;

  const ledger::QualityPolicy& Quality() const {
    return quality_;
  }

 private:
  db::model::StreamRecord        LoadStream(db::Transaction& tx, const streamledger::v1::StreamID& stream) const;
  db::model::ViewerSessionRecord LoadSession(db::Transaction& tx, const streamledger::v1::SessionID& session) const;

  std::shared_ptr<db::Repository>   repository_;
  std::shared_ptr<util::TimeSource> clock_;
  ledger::QualityPolicy             quality_;
  std::string                       moderator_address_;
  std::unique_ptr<events::EventJournal> journal_;

  // Writers (entry points) take it exclusively; accessors take it shared.
  mutable std::shared_mutex mutex_;
};

} // namespace streamledger::core
