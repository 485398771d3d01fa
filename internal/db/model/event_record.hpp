#pragma once

#include <cstdint>
#include <string>

namespace streamledger::db::model {

struct EventRecord {
  uint64_t    sequence = 0;
  std::string kind;
  std::string stream_id;
  uint64_t    timestamp_ms = 0;
  // LedgerEvent encoded as JSON
  std::string body;
};

} // namespace streamledger::db::model
