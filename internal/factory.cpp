#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/grpc/registry_server.hpp"
#include "internal/grpc/revenue_server.hpp"
#include "internal/grpc/stream_lifecycle_server.hpp"
#include "internal/grpc/viewer_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/service/registry_service.hpp"
#include "internal/service/revenue_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/stream_lifecycle_service.hpp"
#include "internal/service/viewer_service.hpp"
#if STREAMLEDGER_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if STREAMLEDGER_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace streamledger::factory {

using namespace streamledger;

namespace {

#if STREAMLEDGER_DB_SQLITE
class SqliteMigrationExecutor final : public db::sql::MigrationExecutor {
 public:
  explicit SqliteMigrationExecutor(db::sqlite::SqliteDB& db) : db_(db) {
  }

  void ExecuteSQL(const std::string& sql) override {
    db_.Exec(sql);
  }

 private:
  db::sqlite::SqliteDB& db_;
};

void BootstrapSqliteSchema(const std::shared_ptr<db::sqlite::SqliteDB>& sqlite_db) {
  SqliteMigrationExecutor executor(*sqlite_db);
  db::sql::RunMigrations(executor, db::sql::SqliteSchema());
}
#endif

#if STREAMLEDGER_DB_POSTGRES
class PgMigrationExecutor final : public db::sql::MigrationExecutor {
 public:
  explicit PgMigrationExecutor(pqxx::work& tx) : tx_(tx) {
  }

  void ExecuteSQL(const std::string& sql) override {
    tx_.exec(sql);
  }

 private:
  pqxx::work& tx_;
};

void BootstrapPostgresSchema(const std::shared_ptr<db::postgres::PgPool>& pool) {
  auto       conn = pool->Acquire();
  pqxx::work tx(*conn);

  PgMigrationExecutor executor(tx);
  db::sql::RunMigrations(executor, db::sql::PostgresSchema());
  tx.commit();
}
#endif

} // namespace

ledger::QualityPolicy ResolveQualityPolicy(const streamledger::runtime::config::LedgerConfig& config) {
  ledger::QualityPolicy policy;
  if (config.has_max_quality_tier()) {
    policy.max_tier = config.max_quality_tier();
  }
  if (config.has_default_quality_tier()) {
    policy.session_tier = config.default_quality_tier();
  }
  if (policy.session_tier > policy.max_tier) {
    throw std::runtime_error("ledger.default_quality_tier " + std::to_string(policy.session_tier) + " exceeds max_quality_tier " +
                             std::to_string(policy.max_tier));
  }
  return policy;
}

std::shared_ptr<db::Repository> BuildRepository(const streamledger::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if STREAMLEDGER_DB_SQLITE
    const auto& sqlite    = database.sqlite();
    auto        sqlite_db = std::make_shared<db::sqlite::SqliteDB>(sqlite.path().empty() ? "streamledger.db" : sqlite.path(), sqlite.wal_mode());
    BootstrapSqliteSchema(sqlite_db);
    STREAMLEDGER_LOG_INFO("sqlite repository ready", {observability::StringField("path", sqlite.path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if STREAMLEDGER_DB_POSTGRES
    const auto& postgres = database.postgres();
    auto        pool     = std::make_shared<db::postgres::PgPool>(postgres.connection_uri(), postgres.max_connections() > 0 ? postgres.max_connections() : 16);
    BootstrapPostgresSchema(pool);
    STREAMLEDGER_LOG_INFO("postgres repository ready");
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  STREAMLEDGER_LOG_INFO("memory repository ready");
  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const streamledger::runtime::config::RuntimeConfig& config, std::shared_ptr<util::TimeSource> clock) {
  Application app;

  // ------------------------------------------------------------------
  // Core
  // ------------------------------------------------------------------
  if (!clock) {
    clock = std::make_shared<util::SystemTimeSource>();
  }
  app.repository = BuildRepository(config);
  app.ledger     = std::make_shared<core::StreamLedger>(app.repository, std::move(clock), ResolveQualityPolicy(config.ledger()),
                                                    config.ledger().moderator_address());
  observability::Metrics::Instance().SetActiveStreams(app.ledger->GetRegistry().active_streams());

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.ledger = app.ledger;

  auto lifecycle_service = std::make_shared<service::StreamLifecycleService>(ctx);
  auto viewer_service    = std::make_shared<service::ViewerService>(ctx);
  auto revenue_service   = std::make_shared<service::RevenueService>(ctx);
  auto registry_service  = std::make_shared<service::RegistryService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::StreamLifecycleServer>(lifecycle_service));
  app.grpc_services.push_back(std::make_unique<grpc::ViewerServer>(viewer_service));
  app.grpc_services.push_back(std::make_unique<grpc::RevenueServer>(revenue_service));
  app.grpc_services.push_back(std::make_unique<grpc::RegistryServer>(registry_service));

  return app;
}

} // namespace streamledger::factory
