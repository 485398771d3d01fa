#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/ledger/revenue_split.hpp"
#include "internal/model/stream_status.hpp"

namespace streamledger::db::model {

struct StreamRecord {
  std::string id;
  std::string creator;

  std::string              title;
  std::string              description;
  std::string              category;
  std::string              content_rating;
  std::vector<std::string> tags;
  std::string              thumbnail_ref;
  std::string              manifest_ref;

  streamledger::model::StreamStatus status = streamledger::model::StreamStatus::kCreated;

  uint64_t created_at_ms = 0;
  uint64_t started_at_ms = 0;
  uint64_t ended_at_ms   = 0;

  uint64_t viewer_count = 0;
  uint64_t revenue      = 0;

  std::vector<uint32_t>               quality_levels;
  streamledger::ledger::RevenueSplits revenue_splits;

  bool     is_monetized       = false;
  uint64_t subscription_price = 0;
  bool     tip_enabled        = false;
  uint32_t moderation_score   = 100;
};

} // namespace streamledger::db::model
