#pragma once

#include <map>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace streamledger::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertStream(Transaction&, const model::StreamRecord&) override;
  std::optional<model::StreamRecord> GetStream(Transaction&, const std::string&) override;
  Result UpdateStream(Transaction&, const model::StreamRecord&) override;

  Result InsertSegment(Transaction&, const model::SegmentRecord&) override;
  std::optional<model::SegmentRecord> GetSegment(Transaction&, const std::string& stream_id,
                                                 uint64_t segment_number) override;
  uint64_t CountSegments(Transaction&, const std::string& stream_id) override;

  Result InsertSession(Transaction&, const model::ViewerSessionRecord&) override;
  std::optional<model::ViewerSessionRecord> GetSession(Transaction&, const std::string&) override;
  Result UpdateSession(Transaction&, const model::ViewerSessionRecord&) override;

  model::RegistryRecord GetRegistry(Transaction&) override;
  Result PutRegistry(Transaction&, const model::RegistryRecord&) override;
  Result AppendCategoryEntry(Transaction&, const std::string& category,
                             const std::string& stream_id) override;
  std::vector<model::CategoryEntryRecord> ListCategory(Transaction&, const std::string& category) override;

  std::optional<model::AccountRecord> GetAccount(Transaction&, const std::string& address) override;
  Result UpsertAccount(Transaction&, const model::AccountRecord&) override;

  Result AppendEvent(Transaction&, model::EventRecord&) override;
  std::vector<model::EventRecord> ListEvents(Transaction&, uint64_t after_sequence,
                                             std::optional<uint64_t> max_events) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::StreamRecord> streams;
    std::unordered_map<std::string, std::map<uint64_t, model::SegmentRecord>> segments;
    std::unordered_map<std::string, model::ViewerSessionRecord> sessions;

    model::RegistryRecord registry;
    std::unordered_map<std::string, std::vector<std::string>> categories;

    std::unordered_map<std::string, model::AccountRecord> accounts;

    std::vector<model::EventRecord> events;
    uint64_t next_event_sequence = 1;
  };

  std::mutex mutex_;
  State committed_;
  uint64_t committed_version_ = 0;
};

}
