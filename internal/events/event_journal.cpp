#include "event_journal.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace streamledger::events {

using streamledger::core::v1::LedgerEvent;

EventJournal::EventJournal(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

std::string_view EventJournal::KindOf(const LedgerEvent& event) {
  switch (event.body_case()) {
    case LedgerEvent::kStreamCreated:
      return "stream_created";
    case LedgerEvent::kStreamStarted:
      return "stream_started";
    case LedgerEvent::kStreamEnded:
      return "stream_ended";
    case LedgerEvent::kSegmentStored:
      return "segment_stored";
    case LedgerEvent::kViewerJoined:
      return "viewer_joined";
    case LedgerEvent::kTipSent:
      return "tip_sent";
    case LedgerEvent::BODY_NOT_SET:
      break;
  }
  return "";
}

std::string EventJournal::StreamOf(const LedgerEvent& event) {
  switch (event.body_case()) {
    case LedgerEvent::kStreamCreated:
      return event.stream_created().stream().value();
    case LedgerEvent::kStreamStarted:
      return event.stream_started().stream().value();
    case LedgerEvent::kStreamEnded:
      return event.stream_ended().stream().value();
    case LedgerEvent::kSegmentStored:
      return event.segment_stored().stream().value();
    case LedgerEvent::kViewerJoined:
      return event.viewer_joined().stream().value();
    case LedgerEvent::kTipSent:
      return event.tip_sent().stream().value();
    case LedgerEvent::BODY_NOT_SET:
      break;
  }
  return {};
}

db::model::EventRecord EventJournal::Encode(const LedgerEvent& event) {
  if (event.body_case() == LedgerEvent::BODY_NOT_SET) {
    throw util::InvalidArgument("ledger event has no body");
  }

  // sequence belongs to the row, not to the body
  LedgerEvent body = event;
  body.clear_sequence();

  db::model::EventRecord record;
  record.kind         = std::string(KindOf(event));
  record.stream_id    = StreamOf(event);
  record.timestamp_ms = event.timestamp_ms();

  const auto status = google::protobuf::util::MessageToJsonString(body, &record.body);
  if (!status.ok()) {
    throw std::runtime_error("encode ledger event: " + std::string(status.message()));
  }
  return record;
}

LedgerEvent EventJournal::Decode(const db::model::EventRecord& record) {
  LedgerEvent event;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;
  const auto status             = google::protobuf::util::JsonStringToMessage(record.body, &event, options);
  if (!status.ok()) {
    throw std::runtime_error("decode ledger event " + std::to_string(record.sequence) + ": " + std::string(status.message()));
  }

  event.set_sequence(record.sequence);
  return event;
}

void EventJournal::Append(db::Transaction& tx, LedgerEvent& event, uint64_t now_ms) {
  event.set_timestamp_ms(now_ms);

  auto       record = Encode(event);
  const auto result = repository_->AppendEvent(tx, record);
  if (!result) {
    throw std::runtime_error("append ledger event: " + result.message);
  }
  event.set_sequence(record.sequence);
}

std::vector<LedgerEvent> EventJournal::List(db::Transaction& tx, uint64_t after_sequence, std::optional<uint64_t> max_events) {
  const auto records = repository_->ListEvents(tx, after_sequence, max_events);

  std::vector<LedgerEvent> events;
  events.reserve(records.size());
  for (const auto& record : records) {
    events.push_back(Decode(record));
  }
  return events;
}

} // namespace streamledger::events
