#include "migrations.hpp"

namespace streamledger::db::sql {

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  for (const auto& sql : ordered_sql) {
    executor.ExecuteSQL(sql);
  }
}

const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS streams (id TEXT PRIMARY KEY, creator TEXT NOT NULL, title TEXT NOT NULL, description TEXT NOT NULL, "
      "category TEXT NOT NULL, content_rating TEXT NOT NULL, tags TEXT NOT NULL, thumbnail_ref TEXT NOT NULL, manifest_ref TEXT NOT NULL, "
      "status INTEGER NOT NULL, created_at_ms INTEGER NOT NULL, started_at_ms INTEGER NOT NULL, ended_at_ms INTEGER NOT NULL, "
      "viewer_count INTEGER NOT NULL, revenue INTEGER NOT NULL, quality_levels TEXT NOT NULL, revenue_splits TEXT NOT NULL, "
      "is_monetized INTEGER NOT NULL, subscription_price INTEGER NOT NULL, tip_enabled INTEGER NOT NULL, moderation_score INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS stream_segments (stream_id TEXT NOT NULL REFERENCES streams(id), segment_number INTEGER NOT NULL, "
      "blob_ref TEXT NOT NULL, stored_at_ms INTEGER NOT NULL, PRIMARY KEY (stream_id, segment_number));",
      "CREATE TABLE IF NOT EXISTS viewer_sessions (id TEXT PRIMARY KEY, stream_id TEXT NOT NULL, viewer TEXT NOT NULL, "
      "started_at_ms INTEGER NOT NULL, last_heartbeat_ms INTEGER NOT NULL, total_watch_time_ms INTEGER NOT NULL, "
      "quality_level INTEGER NOT NULL, has_paid INTEGER NOT NULL, tips_sent INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS registry (id INTEGER PRIMARY KEY CHECK (id = 1), total_streams INTEGER NOT NULL, "
      "active_streams INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS category_index (category TEXT NOT NULL, position INTEGER NOT NULL, stream_id TEXT NOT NULL, "
      "PRIMARY KEY (category, position));",
      "CREATE TABLE IF NOT EXISTS accounts (address TEXT PRIMARY KEY, balance INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS ledger_events (sequence INTEGER PRIMARY KEY AUTOINCREMENT, kind TEXT NOT NULL, stream_id TEXT NOT NULL, "
      "timestamp_ms INTEGER NOT NULL, body TEXT NOT NULL);",
      "INSERT OR IGNORE INTO registry(id,total_streams,active_streams) VALUES(1,0,0);"};
  return kSchema;
}

const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS streams (id TEXT PRIMARY KEY, creator TEXT NOT NULL, title TEXT NOT NULL, description TEXT NOT NULL, "
      "category TEXT NOT NULL, content_rating TEXT NOT NULL, tags JSONB NOT NULL, thumbnail_ref TEXT NOT NULL, manifest_ref TEXT NOT NULL, "
      "status SMALLINT NOT NULL, created_at_ms BIGINT NOT NULL, started_at_ms BIGINT NOT NULL, ended_at_ms BIGINT NOT NULL, "
      "viewer_count BIGINT NOT NULL, revenue BIGINT NOT NULL, quality_levels JSONB NOT NULL, revenue_splits JSONB NOT NULL, "
      "is_monetized BOOLEAN NOT NULL, subscription_price BIGINT NOT NULL, tip_enabled BOOLEAN NOT NULL, moderation_score INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS stream_segments (stream_id TEXT NOT NULL REFERENCES streams(id), segment_number BIGINT NOT NULL, "
      "blob_ref TEXT NOT NULL, stored_at_ms BIGINT NOT NULL, PRIMARY KEY (stream_id, segment_number));",
      "CREATE TABLE IF NOT EXISTS viewer_sessions (id TEXT PRIMARY KEY, stream_id TEXT NOT NULL, viewer TEXT NOT NULL, "
      "started_at_ms BIGINT NOT NULL, last_heartbeat_ms BIGINT NOT NULL, total_watch_time_ms BIGINT NOT NULL, "
      "quality_level INTEGER NOT NULL, has_paid BOOLEAN NOT NULL, tips_sent BIGINT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS registry (id SMALLINT PRIMARY KEY CHECK (id = 1), total_streams BIGINT NOT NULL, "
      "active_streams BIGINT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS category_index (category TEXT NOT NULL, position BIGINT NOT NULL, stream_id TEXT NOT NULL, "
      "PRIMARY KEY (category, position));",
      "CREATE TABLE IF NOT EXISTS accounts (address TEXT PRIMARY KEY, balance BIGINT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS ledger_events (sequence BIGSERIAL PRIMARY KEY, kind TEXT NOT NULL, stream_id TEXT NOT NULL, "
      "timestamp_ms BIGINT NOT NULL, body JSONB NOT NULL);",
      "INSERT INTO registry(id,total_streams,active_streams) VALUES(1,0,0) ON CONFLICT(id) DO NOTHING;"};
  return kSchema;
}

} // namespace streamledger::db::sql
