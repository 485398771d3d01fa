#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/ledger/revenue_split.hpp"

namespace streamledger::db::sql {

/*
  JSON encoding for the list/map columns of the streams table.

  Both SQL backends store tags, quality levels and revenue splits as JSON text
  built from google::protobuf::Struct / ListValue.
*/

std::string EncodeTags(const std::vector<std::string>& tags);
std::vector<std::string> DecodeTags(const std::string& json);

std::string EncodeQualityLevels(const std::vector<uint32_t>& levels);
std::vector<uint32_t> DecodeQualityLevels(const std::string& json);

std::string EncodeRevenueSplits(const streamledger::ledger::RevenueSplits& splits);
streamledger::ledger::RevenueSplits DecodeRevenueSplits(const std::string& json);

} // namespace streamledger::db::sql
