#pragma once

#include <cstdint>
#include <string>

namespace streamledger::db::model {

// Singleton row; active_streams <= total_streams.
struct RegistryRecord {
  uint64_t total_streams  = 0;
  uint64_t active_streams = 0;
};

struct CategoryEntryRecord {
  std::string category;
  uint64_t    position = 0;
  std::string stream_id;
};

} // namespace streamledger::db::model
