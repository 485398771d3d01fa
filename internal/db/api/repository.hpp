#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/account_record.hpp"
#include "internal/db/model/event_record.hpp"
#include "internal/db/model/registry_record.hpp"
#include "internal/db/model/segment_record.hpp"
#include "internal/db/model/stream_record.hpp"
#include "internal/db/model/viewer_session_record.hpp"

namespace streamledger::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - A transaction that is not committed leaves no trace
  - Entry-point atomicity depends on this behavior

  The DB is the source of truth for:
    streams and their segment index
    viewer sessions
    the registry and category index
    payout accounts
    the event journal
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Streams
  // ---------------------------------------------------------------------

  virtual Result InsertStream(Transaction&, const model::StreamRecord&) = 0;

  virtual std::optional<model::StreamRecord> GetStream(Transaction&, const std::string& id) = 0;

  virtual Result UpdateStream(Transaction&, const model::StreamRecord&) = 0;

  // ---------------------------------------------------------------------
  // Segment index
  // ---------------------------------------------------------------------

  // Fails with AlreadyExists when the segment number is taken.
  virtual Result InsertSegment(Transaction&, const model::SegmentRecord&) = 0;

  virtual std::optional<model::SegmentRecord> GetSegment(Transaction&, const std::string& stream_id, uint64_t segment_number) = 0;

  virtual uint64_t CountSegments(Transaction&, const std::string& stream_id) = 0;

  // ---------------------------------------------------------------------
  // Viewer sessions
  // ---------------------------------------------------------------------

  virtual Result InsertSession(Transaction&, const model::ViewerSessionRecord&) = 0;

  virtual std::optional<model::ViewerSessionRecord> GetSession(Transaction&, const std::string& id) = 0;

  virtual Result UpdateSession(Transaction&, const model::ViewerSessionRecord&) = 0;

  // ---------------------------------------------------------------------
  // Registry
  // ---------------------------------------------------------------------

  virtual model::RegistryRecord GetRegistry(Transaction&) = 0;

  virtual Result PutRegistry(Transaction&, const model::RegistryRecord&) = 0;

  // Appends at the end of the category bucket, creating it on first use.
  virtual Result AppendCategoryEntry(Transaction&, const std::string& category, const std::string& stream_id) = 0;

  virtual std::vector<model::CategoryEntryRecord> ListCategory(Transaction&, const std::string& category) = 0;

  // ---------------------------------------------------------------------
  // Payout accounts
  // ---------------------------------------------------------------------

  virtual std::optional<model::AccountRecord> GetAccount(Transaction&, const std::string& address) = 0;

  virtual Result UpsertAccount(Transaction&, const model::AccountRecord&) = 0;

  // ---------------------------------------------------------------------
  // Event journal
  // ---------------------------------------------------------------------

  // Assigns the next sequence number to the record.
  virtual Result AppendEvent(Transaction&, model::EventRecord&) = 0;

  virtual std::vector<model::EventRecord> ListEvents(Transaction&, uint64_t after_sequence, std::optional<uint64_t> max_events) = 0;
};

} // namespace streamledger::db
