#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "streamledger/core/v1/events.pb.h"

namespace streamledger::events {

/*
  Ledger event journal.

  Events are written through the same transaction as the state change that
  produced them, so a rolled back entry point leaves no event behind. The
  repository assigns the sequence number; the body is stored as the JSON form
  of LedgerEvent.
*/
class EventJournal {
 public:
  explicit EventJournal(std::shared_ptr<db::Repository> repository);

  // Stamps timestamp_ms, appends, and writes the assigned sequence back.
  void Append(db::Transaction& tx, streamledger::core::v1::LedgerEvent& event, uint64_t now_ms);

  std::vector<streamledger::core::v1::LedgerEvent> List(db::Transaction& tx, uint64_t after_sequence,
                                                        std::optional<uint64_t> max_events);

  static std::string_view KindOf(const streamledger::core::v1::LedgerEvent& event);
  static std::string      StreamOf(const streamledger::core::v1::LedgerEvent& event);

  static db::model::EventRecord              Encode(const streamledger::core::v1::LedgerEvent& event);
  static streamledger::core::v1::LedgerEvent Decode(const db::model::EventRecord& record);

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace streamledger::events
