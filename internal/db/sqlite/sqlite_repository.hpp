#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace streamledger::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertStream(Transaction&, const model::StreamRecord&) override;
  std::optional<model::StreamRecord> GetStream(Transaction&, const std::string& id) override;
  Result UpdateStream(Transaction&, const model::StreamRecord&) override;

  Result InsertSegment(Transaction&, const model::SegmentRecord&) override;
  std::optional<model::SegmentRecord> GetSegment(Transaction&, const std::string& stream_id, uint64_t segment_number) override;
  uint64_t CountSegments(Transaction&, const std::string& stream_id) override;

  Result InsertSession(Transaction&, const model::ViewerSessionRecord&) override;
  std::optional<model::ViewerSessionRecord> GetSession(Transaction&, const std::string& id) override;
  Result UpdateSession(Transaction&, const model::ViewerSessionRecord&) override;

  model::RegistryRecord GetRegistry(Transaction&) override;
  Result PutRegistry(Transaction&, const model::RegistryRecord&) override;
  Result AppendCategoryEntry(Transaction&, const std::string& category, const std::string& stream_id) override;
  std::vector<model::CategoryEntryRecord> ListCategory(Transaction&, const std::string& category) override;

  std::optional<model::AccountRecord> GetAccount(Transaction&, const std::string& address) override;
  Result UpsertAccount(Transaction&, const model::AccountRecord&) override;

  Result AppendEvent(Transaction&, model::EventRecord&) override;
  std::vector<model::EventRecord> ListEvents(Transaction&, uint64_t after_sequence, std::optional<uint64_t> max_events) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
