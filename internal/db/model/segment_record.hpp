#pragma once

#include <cstdint>
#include <string>

namespace streamledger::db::model {

struct SegmentRecord {
  std::string stream_id;
  uint64_t    segment_number = 0;
  std::string blob_ref;
  uint64_t    stored_at_ms = 0;
};

} // namespace streamledger::db::model
