#include "pg_pool.hpp"

namespace streamledger::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    {
      std::unique_lock lock(mutex_);

      if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        return Wrap(conn.release());
      }

      if (live_connections_ < max_connections_) {
        ++live_connections_;
        lock.unlock();

        try {
          auto conn = std::make_unique<pqxx::connection>(conninfo_);
          PrepareStatements(*conn);
          return Wrap(conn.release());
        } catch (...) {
          std::lock_guard rollback_lock(mutex_);
          --live_connections_;
          cv_.notify_one();
          throw;
        }
      }

      cv_.wait(lock, [this] {
        return !idle_.empty() || live_connections_ < max_connections_;
      });
    }
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  static const std::string kStreamColumns =
      "id,creator,title,description,category,content_rating,tags::text,thumbnail_ref,manifest_ref,status,"
      "created_at_ms,started_at_ms,ended_at_ms,viewer_count,revenue,quality_levels::text,revenue_splits::text,"
      "is_monetized,subscription_price,tip_enabled,moderation_score";

  conn.prepare("get_stream", "SELECT " + kStreamColumns + " FROM streams WHERE id=$1");

  conn.prepare("insert_stream",
               "INSERT INTO streams(id,creator,title,description,category,content_rating,tags,thumbnail_ref,manifest_ref,status,"
               "created_at_ms,started_at_ms,ended_at_ms,viewer_count,revenue,quality_levels,revenue_splits,"
               "is_monetized,subscription_price,tip_enabled,moderation_score) "
               "VALUES($1,$2,$3,$4,$5,$6,$7::jsonb,$8,$9,$10,$11,$12,$13,$14,$15,$16::jsonb,$17::jsonb,$18,$19,$20,$21)");

  conn.prepare("update_stream",
               "UPDATE streams SET creator=$2,title=$3,description=$4,category=$5,content_rating=$6,tags=$7::jsonb,"
               "thumbnail_ref=$8,manifest_ref=$9,status=$10,created_at_ms=$11,started_at_ms=$12,ended_at_ms=$13,"
               "viewer_count=$14,revenue=$15,quality_levels=$16::jsonb,revenue_splits=$17::jsonb,is_monetized=$18,"
               "subscription_price=$19,tip_enabled=$20,moderation_score=$21 WHERE id=$1");

  conn.prepare("get_session",
               "SELECT id,stream_id,viewer,started_at_ms,last_heartbeat_ms,total_watch_time_ms,quality_level,has_paid,tips_sent "
               "FROM viewer_sessions WHERE id=$1");

  conn.prepare("get_registry", "SELECT total_streams,active_streams FROM registry WHERE id=1");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace streamledger::db::postgres
