#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace streamledger::ledger {

inline constexpr uint32_t kBasisPointsTotal = 10000;

// recipient address -> share in basis points
using RevenueSplits = std::map<std::string, uint32_t>;

/*
  Builds the split table from (recipient, bps) pairs.

  Rejects with util::InvalidArgument: an empty recipient, a zero share, a
  recipient listed twice, or shares that sum above 10000 bps.

  The table is stored with the stream; distribution does not consult it.
*/
RevenueSplits BuildRevenueSplits(const std::vector<std::pair<std::string, uint32_t>>& entries);

uint32_t TotalBasisPoints(const RevenueSplits& splits);

} // namespace streamledger::ledger
