#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"

#if STREAMLEDGER_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if STREAMLEDGER_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using streamledger::db::ErrorCode;
using streamledger::db::Repository;
using streamledger::db::memory::MemoryRepository;
using streamledger::db::model::AccountRecord;
using streamledger::db::model::EventRecord;
using streamledger::db::model::SegmentRecord;
using streamledger::db::model::StreamRecord;
using streamledger::db::model::ViewerSessionRecord;
using streamledger::model::StreamStatus;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
  // false when a second Begin() on the same repository waits for the first
  bool supports_parallel_transactions = true;
};

StreamRecord MakeStream(const std::string& id) {
  StreamRecord record;
  record.id                 = id;
  record.creator            = "0xcreator";
  record.title              = "title";
  record.description        = "description";
  record.category           = "category";
  record.content_rating     = "pg";
  record.tags               = {"b", "a"};
  record.thumbnail_ref      = "thumb";
  record.status             = StreamStatus::kCreated;
  record.created_at_ms      = 17;
  record.quality_levels     = {2, 3};
  record.revenue_splits     = {{"0xa", 5000}, {"0xb", 1000}};
  record.is_monetized       = true;
  record.subscription_price = 10;
  record.tip_enabled        = true;
  return record;
}

void VerifyStreamReadWrite(Repository& repo, const std::string& id) {
  auto tx = repo.Begin();

  auto record = MakeStream(id);
  assert(repo.InsertStream(*tx, record));
  assert(repo.InsertStream(*tx, record).code == ErrorCode::AlreadyExists);

  auto loaded = repo.GetStream(*tx, id);
  assert(loaded.has_value());
  assert(loaded->creator == "0xcreator");
  assert((loaded->tags == std::vector<std::string>{"b", "a"}));
  assert((loaded->quality_levels == std::vector<uint32_t>{2, 3}));
  assert(loaded->revenue_splits.at("0xa") == 5000);
  assert(loaded->status == StreamStatus::kCreated);
  assert(loaded->moderation_score == 100);

  loaded->status           = StreamStatus::kLive;
  loaded->started_at_ms    = 99;
  loaded->manifest_ref     = "manifest";
  loaded->revenue          = 18'000'000'000'000'000'000ull;
  loaded->viewer_count     = 3;
  loaded->moderation_score = 12;
  assert(repo.UpdateStream(*tx, *loaded));
  tx->Commit();

  auto read  = repo.Begin();
  auto again = repo.GetStream(*read, id);
  assert(again.has_value());
  assert(again->status == StreamStatus::kLive);
  assert(again->manifest_ref == "manifest");
  // full unsigned range survives signed storage columns
  assert(again->revenue == 18'000'000'000'000'000'000ull);
  assert(again->moderation_score == 12);

  auto missing = MakeStream(id + "-missing");
  assert(repo.UpdateStream(*read, missing).code == ErrorCode::NotFound);
  assert(!repo.GetStream(*read, id + "-missing").has_value());
  read->Commit();
}

void VerifySegments(Repository& repo, const std::string& stream_id) {
  auto tx = repo.Begin();
  assert(repo.InsertStream(*tx, MakeStream(stream_id)));

  assert(repo.InsertSegment(*tx, SegmentRecord{.stream_id = stream_id, .segment_number = 0, .blob_ref = "first", .stored_at_ms = 1}));
  assert(repo.InsertSegment(*tx, SegmentRecord{.stream_id = stream_id, .segment_number = 5, .blob_ref = "fifth", .stored_at_ms = 2}));
  const auto duplicate = repo.InsertSegment(*tx, SegmentRecord{.stream_id = stream_id, .segment_number = 0, .blob_ref = "again"});
  assert(duplicate.code == ErrorCode::AlreadyExists);
  tx->Commit();

  auto read = repo.Begin();
  assert(repo.CountSegments(*read, stream_id) == 2);
  const auto first = repo.GetSegment(*read, stream_id, 0);
  assert(first.has_value());
  assert(first->blob_ref == "first");
  assert(!repo.GetSegment(*read, stream_id, 1).has_value());
  assert(repo.CountSegments(*read, stream_id + "-none") == 0);
  read->Commit();
}

void VerifySessions(Repository& repo, const std::string& stream_id, const std::string& session_id) {
  auto tx = repo.Begin();
  assert(repo.InsertStream(*tx, MakeStream(stream_id)));

  ViewerSessionRecord session{.id = session_id, .stream_id = stream_id, .viewer = "0xviewer", .started_at_ms = 5, .last_heartbeat_ms = 5,
                              .quality_level = 2, .has_paid = true};
  assert(repo.InsertSession(*tx, session));
  assert(repo.InsertSession(*tx, session).code == ErrorCode::AlreadyExists);

  session.total_watch_time_ms = 1'000;
  session.tips_sent           = 44;
  assert(repo.UpdateSession(*tx, session));
  tx->Commit();

  auto read   = repo.Begin();
  auto loaded = repo.GetSession(*read, session_id);
  assert(loaded.has_value());
  assert(loaded->viewer == "0xviewer");
  assert(loaded->has_paid);
  assert(loaded->tips_sent == 44);
  assert(loaded->total_watch_time_ms == 1'000);
  assert(!repo.GetSession(*read, session_id + "-none").has_value());
  read->Commit();
}

void VerifyRegistryAndCategories(Repository& repo, const std::string& category) {
  auto tx       = repo.Begin();
  auto registry = repo.GetRegistry(*tx);
  const auto base_total = registry.total_streams;
  registry.total_streams += 2;
  registry.active_streams += 1;
  assert(repo.PutRegistry(*tx, registry));

  assert(repo.AppendCategoryEntry(*tx, category, "0xs2"));
  assert(repo.AppendCategoryEntry(*tx, category, "0xs1"));
  assert(repo.AppendCategoryEntry(*tx, category, "0xs3"));
  tx->Commit();

  auto read = repo.Begin();
  assert(repo.GetRegistry(*read).total_streams == base_total + 2);

  const auto entries = repo.ListCategory(*read, category);
  assert(entries.size() == 3);
  assert(entries[0].stream_id == "0xs2");
  assert(entries[1].stream_id == "0xs1");
  assert(entries[2].stream_id == "0xs3");
  assert(entries[0].position == 0);
  assert(entries[2].position == 2);
  assert(repo.ListCategory(*read, category + "-empty").empty());
  read->Commit();
}

void VerifyAccounts(Repository& repo, const std::string& address) {
  auto tx = repo.Begin();
  assert(!repo.GetAccount(*tx, address).has_value());
  assert(repo.UpsertAccount(*tx, AccountRecord{.address = address, .balance = 20}));
  assert(repo.UpsertAccount(*tx, AccountRecord{.address = address, .balance = 35}));
  tx->Commit();

  auto read    = repo.Begin();
  auto account = repo.GetAccount(*read, address);
  assert(account.has_value());
  assert(account->balance == 35);
  read->Commit();
}

void VerifyEvents(Repository& repo, const std::string& stream_id) {
  auto       tx       = repo.Begin();
  const auto existing = repo.ListEvents(*tx, 0, std::nullopt);
  const auto base     = existing.empty() ? 0 : existing.back().sequence;

  EventRecord first{.kind = "stream_created", .stream_id = stream_id, .timestamp_ms = 1, .body = R"({"streamCreated":{}})"};
  EventRecord second{.kind = "stream_started", .stream_id = stream_id, .timestamp_ms = 2, .body = R"({"streamStarted":{}})"};
  assert(repo.AppendEvent(*tx, first));
  assert(repo.AppendEvent(*tx, second));
  assert(first.sequence > base);
  assert(second.sequence > first.sequence);
  tx->Commit();

  auto       read  = repo.Begin();
  const auto after = repo.ListEvents(*read, base, std::nullopt);
  assert(after.size() == 2);
  assert(after[0].kind == "stream_created");
  assert(after[1].kind == "stream_started");
  assert(after[1].stream_id == stream_id);

  const auto limited = repo.ListEvents(*read, base, 1);
  assert(limited.size() == 1);
  assert(limited[0].sequence == first.sequence);
  assert(repo.ListEvents(*read, second.sequence, std::nullopt).empty());

  // cursors and limits past INT64_MAX must not wrap in signed SQL columns
  const uint64_t past_signed = (uint64_t{1} << 63) + 5;
  assert(repo.ListEvents(*read, past_signed, std::nullopt).empty());
  assert(repo.ListEvents(*read, std::numeric_limits<uint64_t>::max(), 10).empty());
  assert(repo.ListEvents(*read, base, past_signed).size() == 2);
  assert(repo.ListEvents(*read, base, std::numeric_limits<uint64_t>::max()).size() == 2);
  read->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& id) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertStream(*tx, MakeStream(id)));
    assert(repo.AppendCategoryEntry(*tx, "rollback-" + id, id));
    tx->Rollback();
  }
  {
    auto tx = repo.Begin();
    assert(repo.InsertStream(*tx, MakeStream(id + "-dropped")));
    // destroyed without commit
  }

  auto tx = repo.Begin();
  assert(!repo.GetStream(*tx, id).has_value());
  assert(!repo.GetStream(*tx, id + "-dropped").has_value());
  assert(repo.ListCategory(*tx, "rollback-" + id).empty());
  tx->Commit();
}

// Two writers on the same row: the first commit wins and the second is refused
// rather than silently overwriting.
void VerifyConflictingWriters(Repository& repo, const std::string& id, bool supports_parallel_transactions) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertStream(*tx, MakeStream(id)));
    tx->Commit();
  }

  if (!supports_parallel_transactions) {
    return;
  }

  auto tx1 = repo.Begin();
  auto tx2 = repo.Begin();

  auto r1 = repo.GetStream(*tx1, id);
  auto r2 = repo.GetStream(*tx2, id);
  assert(r1.has_value() && r2.has_value());

  r1->revenue = 1;
  r2->revenue = 2;

  assert(repo.UpdateStream(*tx1, *r1));
  tx1->Commit();

  bool refused = false;
  try {
    if (!repo.UpdateStream(*tx2, *r2)) {
      refused = true;
    } else {
      tx2->Commit();
    }
  } catch (const std::exception&) {
    refused = true;
  }
  assert(refused);
  if (!tx2->IsCommitted()) {
    tx2->Rollback();
  }

  auto verify_tx = repo.Begin();
  auto final     = repo.GetStream(*verify_tx, id);
  assert(final.has_value());
  assert(final->revenue == 1);
  verify_tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& id) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx = repo->Begin();
    assert(repo->InsertStream(*tx, MakeStream(id)));
    assert(repo->InsertSegment(*tx, SegmentRecord{.stream_id = id, .segment_number = 3, .blob_ref = "durable", .stored_at_ms = 9}));
    assert(repo->UpsertAccount(*tx, AccountRecord{.address = id + "-owner", .balance = 77}));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  auto s  = repo->GetStream(*tx, id);
  assert(s.has_value());
  assert(s->title == "title");
  assert(repo->GetSegment(*tx, id, 3)->blob_ref == "durable");
  assert(repo->GetAccount(*tx, id + "-owner")->balance == 77);
  tx->Commit();
}

template <typename Executor>
void ApplySchema(Executor&& exec, const std::vector<std::string>& schema) {
  for (const auto& sql : schema) {
    exec(sql);
  }
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name                           = "memory",
      .make_repository                = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart               = []() { return false; },
      .restart                        = [](std::shared_ptr<Repository>&) {},
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}

#if STREAMLEDGER_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("streamledger_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<streamledger::db::sqlite::SqliteDB>(db_path);
    ApplySchema([&](const std::string& sql) { db->Exec(sql); }, streamledger::db::sql::SqliteSchema());
    return std::make_shared<streamledger::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name                           = "sqlite",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup                        = [db_path]() { std::filesystem::remove(db_path); },
      .supports_parallel_transactions = false,
  };
}
#endif

#if STREAMLEDGER_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("STREAMLEDGER_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("STREAMLEDGER_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() {
    auto       pool = std::make_shared<streamledger::db::postgres::PgPool>(conninfo);
    auto       conn = pool->Acquire();
    pqxx::work tx(*conn);
    ApplySchema([&](const std::string& sql) { tx.exec(sql); }, streamledger::db::sql::PostgresSchema());
    tx.commit();
    return std::make_shared<streamledger::db::postgres::PgRepository>(std::move(pool));
  };

  return BackendFactory{
      .name                           = "postgres",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto       repo   = backend.make_repository();
  const auto prefix = backend.name + "-" + std::to_string(NowMs());

  VerifyStreamReadWrite(*repo, prefix + "-stream");
  VerifySegments(*repo, prefix + "-segments");
  VerifySessions(*repo, prefix + "-session-stream", prefix + "-session");
  VerifyRegistryAndCategories(*repo, prefix + "-category");
  VerifyAccounts(*repo, prefix + "-account");
  VerifyEvents(*repo, prefix + "-events");
  VerifyRollbackBehavior(*repo, prefix + "-rollback");
  VerifyConflictingWriters(*repo, prefix + "-conflict", backend.supports_parallel_transactions);

  repo.reset();
  VerifyRestartDurability(backend, prefix + "-durable");

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if STREAMLEDGER_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if STREAMLEDGER_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "streamledger_integration_repository_parity: pass\n";
  return 0;
}
