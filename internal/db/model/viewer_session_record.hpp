#pragma once

#include <cstdint>
#include <string>

namespace streamledger::db::model {

struct ViewerSessionRecord {
  std::string id;
  std::string stream_id;
  std::string viewer;
  uint64_t    started_at_ms       = 0;
  uint64_t    last_heartbeat_ms   = 0;
  uint64_t    total_watch_time_ms = 0;
  uint32_t    quality_level       = 0;
  bool        has_paid            = false;
  uint64_t    tips_sent           = 0;
};

} // namespace streamledger::db::model
