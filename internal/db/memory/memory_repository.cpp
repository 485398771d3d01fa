#include "memory_repository.hpp"

#include "memory_tx.hpp"

namespace streamledger::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::InsertStream(Transaction& t, const model::StreamRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.streams.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "stream " + r.id);
  s.streams[r.id] = r;
  return Result::Ok();
}

std::optional<model::StreamRecord> MemoryRepository::GetStream(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.streams.find(id);
  if (it == s.streams.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateStream(Transaction& t, const model::StreamRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.streams.contains(r.id)) return Result::Err(ErrorCode::NotFound, "stream " + r.id);
  s.streams[r.id] = r;
  return Result::Ok();
}

Result MemoryRepository::InsertSegment(Transaction& t, const model::SegmentRecord& r) {
  auto& index = TX(t).Mutable().segments[r.stream_id];
  if (!index.emplace(r.segment_number, r).second) {
    return Result::Err(ErrorCode::AlreadyExists, "segment " + std::to_string(r.segment_number));
  }
  return Result::Ok();
}

std::optional<model::SegmentRecord> MemoryRepository::GetSegment(Transaction& t, const std::string& stream_id, uint64_t segment_number) {
  const auto& s  = TX(t).View();
  const auto  it = s.segments.find(stream_id);
  if (it == s.segments.end()) return std::nullopt;
  const auto seg = it->second.find(segment_number);
  if (seg == it->second.end()) return std::nullopt;
  return seg->second;
}

uint64_t MemoryRepository::CountSegments(Transaction& t, const std::string& stream_id) {
  const auto& s  = TX(t).View();
  const auto  it = s.segments.find(stream_id);
  return it == s.segments.end() ? 0 : it->second.size();
}

Result MemoryRepository::InsertSession(Transaction& t, const model::ViewerSessionRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.sessions.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "session " + r.id);
  s.sessions[r.id] = r;
  return Result::Ok();
}

std::optional<model::ViewerSessionRecord> MemoryRepository::GetSession(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.sessions.find(id);
  if (it == s.sessions.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateSession(Transaction& t, const model::ViewerSessionRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.sessions.contains(r.id)) return Result::Err(ErrorCode::NotFound, "session " + r.id);
  s.sessions[r.id] = r;
  return Result::Ok();
}

model::RegistryRecord MemoryRepository::GetRegistry(Transaction& t) {
  return TX(t).View().registry;
}

Result MemoryRepository::PutRegistry(Transaction& t, const model::RegistryRecord& r) {
  TX(t).Mutable().registry = r;
  return Result::Ok();
}

Result MemoryRepository::AppendCategoryEntry(Transaction& t, const std::string& category, const std::string& stream_id) {
  TX(t).Mutable().categories[category].push_back(stream_id);
  return Result::Ok();
}

std::vector<model::CategoryEntryRecord> MemoryRepository::ListCategory(Transaction& t, const std::string& category) {
  const auto& s  = TX(t).View();
  const auto  it = s.categories.find(category);
  if (it == s.categories.end()) return {};

  std::vector<model::CategoryEntryRecord> out;
  out.reserve(it->second.size());
  for (uint64_t i = 0; i < it->second.size(); ++i) {
    out.push_back(model::CategoryEntryRecord{.category = category, .position = i, .stream_id = it->second[i]});
  }
  return out;
}

std::optional<model::AccountRecord> MemoryRepository::GetAccount(Transaction& t, const std::string& address) {
  const auto& s  = TX(t).View();
  auto        it = s.accounts.find(address);
  if (it == s.accounts.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpsertAccount(Transaction& t, const model::AccountRecord& r) {
  TX(t).Mutable().accounts[r.address] = r;
  return Result::Ok();
}

Result MemoryRepository::AppendEvent(Transaction& t, model::EventRecord& r) {
  auto& s    = TX(t).Mutable();
  r.sequence = s.next_event_sequence++;
  s.events.push_back(r);
  return Result::Ok();
}

std::vector<model::EventRecord> MemoryRepository::ListEvents(Transaction& t, uint64_t after_sequence, std::optional<uint64_t> max_events) {
  const auto&                     s = TX(t).View();
  std::vector<model::EventRecord> out;
  for (const auto& e : s.events) {
    if (e.sequence <= after_sequence) continue;
    if (max_events.has_value() && out.size() >= *max_events) break;
    out.push_back(e);
  }
  return out;
}

} // namespace streamledger::db::memory
