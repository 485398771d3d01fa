#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <limits>
#include <stdexcept>

#include "internal/db/sql/record_codec.hpp"

namespace streamledger::db::sqlite {

using streamledger::db::ErrorCode;
using streamledger::db::Result;

namespace {

using StmtPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

StmtPtr Prepare(sqlite3* db, const char* sql) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
    }
    return StmtPtr(st, &sqlite3_finalize);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindBool(sqlite3_stmt* st, int idx, bool v) {
    sqlite3_bind_int(st, idx, v ? 1 : 0);
}

std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

bool ColBool(sqlite3_stmt* st, int col) {
    return sqlite3_column_int(st, col) != 0;
}

constexpr const char* kStreamColumns =
    "id,creator,title,description,category,content_rating,tags,thumbnail_ref,manifest_ref,status,"
    "created_at_ms,started_at_ms,ended_at_ms,viewer_count,revenue,quality_levels,revenue_splits,"
    "is_monetized,subscription_price,tip_enabled,moderation_score";

// Binds every column except id, starting at idx.
int BindStreamBody(sqlite3_stmt* st, int idx, const model::StreamRecord& r) {
    BindText(st, idx++, r.creator);
    BindText(st, idx++, r.title);
    BindText(st, idx++, r.description);
    BindText(st, idx++, r.category);
    BindText(st, idx++, r.content_rating);
    BindText(st, idx++, sql::EncodeTags(r.tags));
    BindText(st, idx++, r.thumbnail_ref);
    BindText(st, idx++, r.manifest_ref);
    BindU64(st, idx++, static_cast<uint64_t>(r.status));
    BindU64(st, idx++, r.created_at_ms);
    BindU64(st, idx++, r.started_at_ms);
    BindU64(st, idx++, r.ended_at_ms);
    BindU64(st, idx++, r.viewer_count);
    BindU64(st, idx++, r.revenue);
    BindText(st, idx++, sql::EncodeQualityLevels(r.quality_levels));
    BindText(st, idx++, sql::EncodeRevenueSplits(r.revenue_splits));
    BindBool(st, idx++, r.is_monetized);
    BindU64(st, idx++, r.subscription_price);
    BindBool(st, idx++, r.tip_enabled);
    BindU64(st, idx++, r.moderation_score);
    return idx;
}

model::StreamRecord ReadStream(sqlite3_stmt* st) {
    model::StreamRecord r;
    r.id                 = ColText(st, 0);
    r.creator            = ColText(st, 1);
    r.title              = ColText(st, 2);
    r.description        = ColText(st, 3);
    r.category           = ColText(st, 4);
    r.content_rating     = ColText(st, 5);
    r.tags               = sql::DecodeTags(ColText(st, 6));
    r.thumbnail_ref      = ColText(st, 7);
    r.manifest_ref       = ColText(st, 8);
    r.status             = static_cast<streamledger::model::StreamStatus>(ColU64(st, 9));
    r.created_at_ms      = ColU64(st, 10);
    r.started_at_ms      = ColU64(st, 11);
    r.ended_at_ms        = ColU64(st, 12);
    r.viewer_count       = ColU64(st, 13);
    r.revenue            = ColU64(st, 14);
    r.quality_levels     = sql::DecodeQualityLevels(ColText(st, 15));
    r.revenue_splits     = sql::DecodeRevenueSplits(ColText(st, 16));
    r.is_monetized       = ColBool(st, 17);
    r.subscription_price = ColU64(st, 18);
    r.tip_enabled        = ColBool(st, 19);
    r.moderation_score   = static_cast<uint32_t>(ColU64(st, 20));
    return r;
}

model::ViewerSessionRecord ReadSession(sqlite3_stmt* st) {
    model::ViewerSessionRecord r;
    r.id                  = ColText(st, 0);
    r.stream_id           = ColText(st, 1);
    r.viewer              = ColText(st, 2);
    r.started_at_ms       = ColU64(st, 3);
    r.last_heartbeat_ms   = ColU64(st, 4);
    r.total_watch_time_ms = ColU64(st, 5);
    r.quality_level       = static_cast<uint32_t>(ColU64(st, 6));
    r.has_paid            = ColBool(st, 7);
    r.tips_sent           = ColU64(st, 8);
    return r;
}

model::EventRecord ReadEvent(sqlite3_stmt* st) {
    model::EventRecord r;
    r.sequence     = ColU64(st, 0);
    r.kind         = ColText(st, 1);
    r.stream_id    = ColText(st, 2);
    r.timestamp_ms = ColU64(st, 3);
    r.body         = ColText(st, 4);
    return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT: {
            const int extended = sqlite3_extended_errcode(db);
            if (extended == SQLITE_CONSTRAINT_PRIMARYKEY || extended == SQLITE_CONSTRAINT_UNIQUE)
                return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        }
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Streams
// ------------------------------------------------------------------

Result SqliteRepository::InsertStream(Transaction& t, const model::StreamRecord& r) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("INSERT INTO streams(") + kStreamColumns +
                            ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);";
    auto st = Prepare(db, sql.c_str());

    BindText(st.get(), 1, r.id);
    BindStreamBody(st.get(), 2, r);

    return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::StreamRecord>
SqliteRepository::GetStream(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kStreamColumns + " FROM streams WHERE id=?;";
    auto st = Prepare(db, sql.c_str());
    BindText(st.get(), 1, id);

    if (sqlite3_step(st.get()) != SQLITE_ROW)
        return std::nullopt;
    return ReadStream(st.get());
}

Result SqliteRepository::UpdateStream(Transaction& t, const model::StreamRecord& r) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db,
        "UPDATE streams SET creator=?,title=?,description=?,category=?,content_rating=?,tags=?,"
        "thumbnail_ref=?,manifest_ref=?,status=?,created_at_ms=?,started_at_ms=?,ended_at_ms=?,"
        "viewer_count=?,revenue=?,quality_levels=?,revenue_splits=?,is_monetized=?,"
        "subscription_price=?,tip_enabled=?,moderation_score=? WHERE id=?;");

    const int next = BindStreamBody(st.get(), 1, r);
    BindText(st.get(), next, r.id);

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE)
        return Translate(db, rc);
    if (sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, "stream " + r.id);
    return Result::Ok();
}

// ------------------------------------------------------------------
// Segment index
// ------------------------------------------------------------------

Result SqliteRepository::InsertSegment(Transaction& t, const model::SegmentRecord& r) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db,
        "INSERT INTO stream_segments(stream_id,segment_number,blob_ref,stored_at_ms) VALUES(?,?,?,?);");
    BindText(st.get(), 1, r.stream_id);
    BindU64(st.get(), 2, r.segment_number);
    BindText(st.get(), 3, r.blob_ref);
    BindU64(st.get(), 4, r.stored_at_ms);

    return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::SegmentRecord>
SqliteRepository::GetSegment(Transaction& t, const std::string& stream_id, uint64_t segment_number) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db,
        "SELECT stream_id,segment_number,blob_ref,stored_at_ms FROM stream_segments "
        "WHERE stream_id=? AND segment_number=?;");
    BindText(st.get(), 1, stream_id);
    BindU64(st.get(), 2, segment_number);

    if (sqlite3_step(st.get()) != SQLITE_ROW)
        return std::nullopt;

    model::SegmentRecord r;
    r.stream_id      = ColText(st.get(), 0);
    r.segment_number = ColU64(st.get(), 1);
    r.blob_ref       = ColText(st.get(), 2);
    r.stored_at_ms   = ColU64(st.get(), 3);
    return r;
}

uint64_t SqliteRepository::CountSegments(Transaction& t, const std::string& stream_id) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, "SELECT COUNT(*) FROM stream_segments WHERE stream_id=?;");
    BindText(st.get(), 1, stream_id);

    if (sqlite3_step(st.get()) != SQLITE_ROW)
        return 0;
    return ColU64(st.get(), 0);
}

// ------------------------------------------------------------------
// Viewer sessions
// ------------------------------------------------------------------

Result SqliteRepository::InsertSession(Transaction& t, const model::ViewerSessionRecord& r) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db,
        "INSERT INTO viewer_sessions(id,stream_id,viewer,started_at_ms,last_heartbeat_ms,"
        "total_watch_time_ms,quality_level,has_paid,tips_sent) VALUES(?,?,?,?,?,?,?,?,?);");
    BindText(st.get(), 1, r.id);
    BindText(st.get(), 2, r.stream_id);
    BindText(st.get(), 3, r.viewer);
    BindU64(st.get(), 4, r.started_at_ms);
    BindU64(st.get(), 5, r.last_heartbeat_ms);
    BindU64(st.get(), 6, r.total_watch_time_ms);
    BindU64(st.get(), 7, r.quality_level);
    BindBool(st.get(), 8, r.has_paid);
    BindU64(st.get(), 9, r.tips_sent);

    return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::ViewerSessionRecord>
SqliteRepository::GetSession(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db,
        "SELECT id,stream_id,viewer,started_at_ms,last_heartbeat_ms,total_watch_time_ms,"
        "quality_level,has_paid,tips_sent FROM viewer_sessions WHERE id=?;");
    BindText(st.get(), 1, id);

    if (sqlite3_step(st.get()) != SQLITE_ROW)
        return std::nullopt;
    return ReadSession(st.get());
}

Result SqliteRepository::UpdateSession(Transaction& t, const model::ViewerSessionRecord& r) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db,
        "UPDATE viewer_sessions SET last_heartbeat_ms=?,total_watch_time_ms=?,quality_level=?,"
        "has_paid=?,tips_sent=? WHERE id=?;");
    BindU64(st.get(), 1, r.last_heartbeat_ms);
    BindU64(st.get(), 2, r.total_watch_time_ms);
    BindU64(st.get(), 3, r.quality_level);
    BindBool(st.get(), 4, r.has_paid);
    BindU64(st.get(), 5, r.tips_sent);
    BindText(st.get(), 6, r.id);

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE)
        return Translate(db, rc);
    if (sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, "session " + r.id);
    return Result::Ok();
}

// ------------------------------------------------------------------
// Registry
// ------------------------------------------------------------------

model::RegistryRecord SqliteRepository::GetRegistry(Transaction& t) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, "SELECT total_streams,active_streams FROM registry WHERE id=1;");

    model::RegistryRecord r;
    if (sqlite3_step(st.get()) == SQLITE_ROW) {
        r.total_streams  = ColU64(st.get(), 0);
        r.active_streams = ColU64(st.get(), 1);
    }
    return r;
}

Result SqliteRepository::PutRegistry(Transaction& t, const model::RegistryRecord& r) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db,
        "INSERT INTO registry(id,total_streams,active_streams) VALUES(1,?,?) "
        "ON CONFLICT(id) DO UPDATE SET total_streams=excluded.total_streams, "
        "active_streams=excluded.active_streams;");
    BindU64(st.get(), 1, r.total_streams);
    BindU64(st.get(), 2, r.active_streams);

    return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::AppendCategoryEntry(Transaction& t, const std::string& category, const std::string& stream_id) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db,
        "INSERT INTO category_index(category,position,stream_id) "
        "SELECT ?1, COALESCE(MAX(position)+1,0), ?2 FROM category_index WHERE category=?1;");
    BindText(st.get(), 1, category);
    BindText(st.get(), 2, stream_id);

    return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::CategoryEntryRecord>
SqliteRepository::ListCategory(Transaction& t, const std::string& category) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db,
        "SELECT category,position,stream_id FROM category_index WHERE category=? ORDER BY position;");
    BindText(st.get(), 1, category);

    std::vector<model::CategoryEntryRecord> out;
    while (sqlite3_step(st.get()) == SQLITE_ROW) {
        model::CategoryEntryRecord r;
        r.category  = ColText(st.get(), 0);
        r.position  = ColU64(st.get(), 1);
        r.stream_id = ColText(st.get(), 2);
        out.push_back(std::move(r));
    }
    return out;
}

// ------------------------------------------------------------------
// Payout accounts
// ------------------------------------------------------------------

std::optional<model::AccountRecord>
SqliteRepository::GetAccount(Transaction& t, const std::string& address) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, "SELECT address,balance FROM accounts WHERE address=?;");
    BindText(st.get(), 1, address);

    if (sqlite3_step(st.get()) != SQLITE_ROW)
        return std::nullopt;

    model::AccountRecord r;
    r.address = ColText(st.get(), 0);
    r.balance = ColU64(st.get(), 1);
    return r;
}

Result SqliteRepository::UpsertAccount(Transaction& t, const model::AccountRecord& r) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db,
        "INSERT INTO accounts(address,balance) VALUES(?,?) "
        "ON CONFLICT(address) DO UPDATE SET balance=excluded.balance;");
    BindText(st.get(), 1, r.address);
    BindU64(st.get(), 2, r.balance);

    return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Event journal
// ------------------------------------------------------------------

Result SqliteRepository::AppendEvent(Transaction& t, model::EventRecord& r) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db,
        "INSERT INTO ledger_events(kind,stream_id,timestamp_ms,body) VALUES(?,?,?,?);");
    BindText(st.get(), 1, r.kind);
    BindText(st.get(), 2, r.stream_id);
    BindU64(st.get(), 3, r.timestamp_ms);
    BindText(st.get(), 4, r.body);

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE)
        return Translate(db, rc);

    r.sequence = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
    return Result::Ok();
}

std::vector<model::EventRecord>
SqliteRepository::ListEvents(Transaction& t, uint64_t after_sequence, std::optional<uint64_t> max_events) {
    constexpr uint64_t kMaxSequence = static_cast<uint64_t>(std::numeric_limits<sqlite3_int64>::max());
    // rowids never exceed INT64_MAX
    if (after_sequence >= kMaxSequence)
        return {};

    auto* db = TX(t).Handle();

    auto st = Prepare(db,
        "SELECT sequence,kind,stream_id,timestamp_ms,body FROM ledger_events "
        "WHERE sequence > ? ORDER BY sequence LIMIT ?;");
    BindU64(st.get(), 1, after_sequence);
    // negative LIMIT is unlimited
    const bool limited = max_events.has_value() && *max_events <= kMaxSequence;
    sqlite3_bind_int64(st.get(), 2, limited ? static_cast<sqlite3_int64>(*max_events) : -1);

    std::vector<model::EventRecord> out;
    while (sqlite3_step(st.get()) == SQLITE_ROW) {
        out.push_back(ReadEvent(st.get()));
    }
    return out;
}

} // namespace streamledger::db::sqlite
