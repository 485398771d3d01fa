#include "pg_repository.hpp"

#include <limits>

#include "internal/db/sql/record_codec.hpp"

namespace streamledger::db::postgres {

namespace {

// BIGINT columns are signed; unsigned values are stored bit-for-bit.
int64_t I64(uint64_t v) {
  return static_cast<int64_t>(v);
}

uint64_t U64(const pqxx::field& f) {
  return static_cast<uint64_t>(f.as<int64_t>());
}

model::StreamRecord ReadStream(const pqxx::row& row) {
  model::StreamRecord r;
  r.id                 = row[0].c_str();
  r.creator            = row[1].c_str();
  r.title              = row[2].c_str();
  r.description        = row[3].c_str();
  r.category           = row[4].c_str();
  r.content_rating     = row[5].c_str();
  r.tags               = sql::DecodeTags(row[6].c_str());
  r.thumbnail_ref      = row[7].c_str();
  r.manifest_ref       = row[8].c_str();
  r.status             = static_cast<streamledger::model::StreamStatus>(row[9].as<int>());
  r.created_at_ms      = U64(row[10]);
  r.started_at_ms      = U64(row[11]);
  r.ended_at_ms        = U64(row[12]);
  r.viewer_count       = U64(row[13]);
  r.revenue            = U64(row[14]);
  r.quality_levels     = sql::DecodeQualityLevels(row[15].c_str());
  r.revenue_splits     = sql::DecodeRevenueSplits(row[16].c_str());
  r.is_monetized       = row[17].as<bool>();
  r.subscription_price = U64(row[18]);
  r.tip_enabled        = row[19].as<bool>();
  r.moderation_score   = row[20].as<uint32_t>();
  return r;
}

model::EventRecord ReadEvent(const pqxx::row& row) {
  model::EventRecord r;
  r.sequence     = U64(row[0]);
  r.kind         = row[1].c_str();
  r.stream_id    = row[2].c_str();
  r.timestamp_ms = U64(row[3]);
  r.body         = row[4].c_str();
  return r;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Streams
// ------------------------------------------------------------------

Result PgRepository::InsertStream(Transaction& t, const model::StreamRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_stream", r.id, r.creator, r.title, r.description, r.category, r.content_rating,
                               sql::EncodeTags(r.tags), r.thumbnail_ref, r.manifest_ref, static_cast<int>(r.status), I64(r.created_at_ms),
                               I64(r.started_at_ms), I64(r.ended_at_ms), I64(r.viewer_count), I64(r.revenue),
                               sql::EncodeQualityLevels(r.quality_levels), sql::EncodeRevenueSplits(r.revenue_splits), r.is_monetized,
                               I64(r.subscription_price), r.tip_enabled, static_cast<int>(r.moderation_score));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::StreamRecord> PgRepository::GetStream(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_stream", id);
  if (res.empty()) return std::nullopt;
  return ReadStream(res[0]);
}

Result PgRepository::UpdateStream(Transaction& t, const model::StreamRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("update_stream", r.id, r.creator, r.title, r.description, r.category, r.content_rating,
                                          sql::EncodeTags(r.tags), r.thumbnail_ref, r.manifest_ref, static_cast<int>(r.status),
                                          I64(r.created_at_ms), I64(r.started_at_ms), I64(r.ended_at_ms), I64(r.viewer_count),
                                          I64(r.revenue), sql::EncodeQualityLevels(r.quality_levels),
                                          sql::EncodeRevenueSplits(r.revenue_splits), r.is_monetized, I64(r.subscription_price),
                                          r.tip_enabled, static_cast<int>(r.moderation_score));
    if (res.affected_rows() == 0) {
      return Result::Err(ErrorCode::NotFound, "stream " + r.id);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Segment index
// ------------------------------------------------------------------

Result PgRepository::InsertSegment(Transaction& t, const model::SegmentRecord& r) {
  try {
    TX(t).Work().exec_params("INSERT INTO stream_segments(stream_id,segment_number,blob_ref,stored_at_ms) VALUES($1,$2,$3,$4);",
                             r.stream_id, I64(r.segment_number), r.blob_ref, I64(r.stored_at_ms));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::SegmentRecord> PgRepository::GetSegment(Transaction& t, const std::string& stream_id, uint64_t segment_number) {
  auto res = TX(t).Work().exec_params(
      "SELECT stream_id,segment_number,blob_ref,stored_at_ms FROM stream_segments WHERE stream_id=$1 AND segment_number=$2;", stream_id,
      I64(segment_number));
  if (res.empty()) return std::nullopt;

  model::SegmentRecord r;
  r.stream_id      = res[0][0].c_str();
  r.segment_number = U64(res[0][1]);
  r.blob_ref       = res[0][2].c_str();
  r.stored_at_ms   = U64(res[0][3]);
  return r;
}

uint64_t PgRepository::CountSegments(Transaction& t, const std::string& stream_id) {
  auto res = TX(t).Work().exec_params("SELECT COUNT(*) FROM stream_segments WHERE stream_id=$1;", stream_id);
  return res.empty() ? 0 : U64(res[0][0]);
}

// ------------------------------------------------------------------
// Viewer sessions
// ------------------------------------------------------------------

Result PgRepository::InsertSession(Transaction& t, const model::ViewerSessionRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO viewer_sessions(id,stream_id,viewer,started_at_ms,last_heartbeat_ms,total_watch_time_ms,quality_level,has_paid,tips_sent) "
        "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9);",
        r.id, r.stream_id, r.viewer, I64(r.started_at_ms), I64(r.last_heartbeat_ms), I64(r.total_watch_time_ms),
        static_cast<int>(r.quality_level), r.has_paid, I64(r.tips_sent));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ViewerSessionRecord> PgRepository::GetSession(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_session", id);
  if (res.empty()) return std::nullopt;

  const auto&                row = res[0];
  model::ViewerSessionRecord r;
  r.id                  = row[0].c_str();
  r.stream_id           = row[1].c_str();
  r.viewer              = row[2].c_str();
  r.started_at_ms       = U64(row[3]);
  r.last_heartbeat_ms   = U64(row[4]);
  r.total_watch_time_ms = U64(row[5]);
  r.quality_level       = row[6].as<uint32_t>();
  r.has_paid            = row[7].as<bool>();
  r.tips_sent           = U64(row[8]);
  return r;
}

Result PgRepository::UpdateSession(Transaction& t, const model::ViewerSessionRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "UPDATE viewer_sessions SET last_heartbeat_ms=$2,total_watch_time_ms=$3,quality_level=$4,has_paid=$5,tips_sent=$6 WHERE id=$1;", r.id,
        I64(r.last_heartbeat_ms), I64(r.total_watch_time_ms), static_cast<int>(r.quality_level), r.has_paid, I64(r.tips_sent));
    if (res.affected_rows() == 0) {
      return Result::Err(ErrorCode::NotFound, "session " + r.id);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Registry
// ------------------------------------------------------------------

model::RegistryRecord PgRepository::GetRegistry(Transaction& t) {
  auto res = TX(t).Work().exec_prepared("get_registry");

  model::RegistryRecord r;
  if (!res.empty()) {
    r.total_streams  = U64(res[0][0]);
    r.active_streams = U64(res[0][1]);
  }
  return r;
}

Result PgRepository::PutRegistry(Transaction& t, const model::RegistryRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO registry(id,total_streams,active_streams) VALUES(1,$1,$2) "
        "ON CONFLICT(id) DO UPDATE SET total_streams=EXCLUDED.total_streams,active_streams=EXCLUDED.active_streams;",
        I64(r.total_streams), I64(r.active_streams));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::AppendCategoryEntry(Transaction& t, const std::string& category, const std::string& stream_id) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO category_index(category,position,stream_id) "
        "SELECT $1, COALESCE(MAX(position)+1,0), $2 FROM category_index WHERE category=$1;",
        category, stream_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::CategoryEntryRecord> PgRepository::ListCategory(Transaction& t, const std::string& category) {
  auto res = TX(t).Work().exec_params("SELECT category,position,stream_id FROM category_index WHERE category=$1 ORDER BY position ASC;", category);

  std::vector<model::CategoryEntryRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::CategoryEntryRecord r;
    r.category  = row[0].c_str();
    r.position  = U64(row[1]);
    r.stream_id = row[2].c_str();
    out.push_back(std::move(r));
  }
  return out;
}

// ------------------------------------------------------------------
// Payout accounts
// ------------------------------------------------------------------

std::optional<model::AccountRecord> PgRepository::GetAccount(Transaction& t, const std::string& address) {
  auto res = TX(t).Work().exec_params("SELECT address,balance FROM accounts WHERE address=$1;", address);
  if (res.empty()) return std::nullopt;

  model::AccountRecord r;
  r.address = res[0][0].c_str();
  r.balance = U64(res[0][1]);
  return r;
}

Result PgRepository::UpsertAccount(Transaction& t, const model::AccountRecord& r) {
  try {
    TX(t).Work().exec_params("INSERT INTO accounts(address,balance) VALUES($1,$2) ON CONFLICT(address) DO UPDATE SET balance=EXCLUDED.balance;",
                             r.address, I64(r.balance));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Event journal
// ------------------------------------------------------------------

Result PgRepository::AppendEvent(Transaction& t, model::EventRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "INSERT INTO ledger_events(kind,stream_id,timestamp_ms,body) VALUES($1,$2,$3,$4::jsonb) RETURNING sequence;", r.kind, r.stream_id,
        I64(r.timestamp_ms), r.body);
    r.sequence = U64(res[0][0]);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::EventRecord> PgRepository::ListEvents(Transaction& t, uint64_t after_sequence, std::optional<uint64_t> max_events) {
  constexpr uint64_t kMaxSequence = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
  // BIGSERIAL never exceeds INT64_MAX
  if (after_sequence >= kMaxSequence) {
    return {};
  }

  pqxx::result res;
  if (max_events.has_value() && *max_events <= kMaxSequence) {
    res = TX(t).Work().exec_params(
        "SELECT sequence,kind,stream_id,timestamp_ms,body::text FROM ledger_events WHERE sequence > $1 ORDER BY sequence ASC LIMIT $2;",
        I64(after_sequence), I64(*max_events));
  } else {
    res = TX(t).Work().exec_params(
        "SELECT sequence,kind,stream_id,timestamp_ms,body::text FROM ledger_events WHERE sequence > $1 ORDER BY sequence ASC;",
        I64(after_sequence));
  }

  std::vector<model::EventRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadEvent(row));
  }
  return out;
}

} // namespace streamledger::db::postgres
