#include <cassert>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/events/event_journal.hpp"
#include "internal/util/errors.hpp"

namespace {

using streamledger::core::v1::LedgerEvent;
using streamledger::events::EventJournal;

LedgerEvent Created(const std::string& stream) {
  LedgerEvent event;
  auto*       body = event.mutable_stream_created();
  body->mutable_stream()->set_value(stream);
  body->mutable_creator()->set_value("0xcreator");
  body->set_title("title");
  body->set_category("cat");
  return event;
}

LedgerEvent Tip(const std::string& stream, uint64_t amount) {
  LedgerEvent event;
  auto*       body = event.mutable_tip_sent();
  body->mutable_stream()->set_value(stream);
  body->mutable_sender()->set_value("0xviewer");
  body->set_amount(amount);
  body->set_message("thanks");
  return event;
}

void TestAppendAssignsSequenceAndTimestamp() {
  auto         repository = std::make_shared<streamledger::db::memory::MemoryRepository>();
  EventJournal journal(repository);

  auto tx    = repository->Begin();
  auto first = Created("0xs1");
  journal.Append(*tx, first, 1'000);
  auto second = Tip("0xs1", 18'446'744'073'709'551'000ull);
  journal.Append(*tx, second, 2'000);
  tx->Commit();

  assert(first.sequence() == 1);
  assert(first.timestamp_ms() == 1'000);
  assert(second.sequence() == 2);

  auto       read   = repository->Begin();
  const auto events = journal.List(*read, 0, std::nullopt);
  assert(events.size() == 2);
  assert(events[0].stream_created().title() == "title");
  assert(events[1].sequence() == 2);
  assert(events[1].timestamp_ms() == 2'000);
  // 64-bit amounts survive the JSON body
  assert(events[1].tip_sent().amount() == 18'446'744'073'709'551'000ull);
}

void TestRolledBackAppendLeavesNothing() {
  auto         repository = std::make_shared<streamledger::db::memory::MemoryRepository>();
  EventJournal journal(repository);

  {
    auto tx    = repository->Begin();
    auto event = Created("0xs1");
    journal.Append(*tx, event, 1);
    // destroyed without commit
  }

  auto tx = repository->Begin();
  assert(journal.List(*tx, 0, std::nullopt).empty());

  auto event = Created("0xs2");
  journal.Append(*tx, event, 2);
  assert(event.sequence() == 1);
}

void TestEncodeRecordsKindAndStream() {
  const auto record = EventJournal::Encode(Tip("0xabc", 3));
  assert(record.kind == "tip_sent");
  assert(record.stream_id == "0xabc");
  assert(record.sequence == 0);

  bool threw = false;
  try {
    (void)EventJournal::Encode(LedgerEvent{});
  } catch (const streamledger::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestDecodeRejectsCorruptBody() {
  streamledger::db::model::EventRecord record;
  record.sequence = 9;
  record.body     = R"({"unknownBody": {}})";

  bool threw = false;
  try {
    (void)EventJournal::Decode(record);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestAppendAssignsSequenceAndTimestamp();
  TestRolledBackAppendLeavesNothing();
  TestEncodeRecordsKindAndStream();
  TestDecodeRejectsCorruptBody();

  std::cout << "streamledger_unit_event_journal: pass\n";
  return 0;
}
