#include "revenue_split.hpp"

#include "internal/util/errors.hpp"

namespace streamledger::ledger {

RevenueSplits BuildRevenueSplits(const std::vector<std::pair<std::string, uint32_t>>& entries) {
  RevenueSplits splits;
  uint64_t      total = 0;

  for (const auto& [recipient, bps] : entries) {
    if (recipient.empty()) {
      throw streamledger::util::InvalidArgument("revenue splits: recipient address is empty");
    }
    if (bps == 0) {
      throw streamledger::util::InvalidArgument("revenue splits: share for " + recipient + " is zero");
    }
    if (!splits.emplace(recipient, bps).second) {
      throw streamledger::util::InvalidArgument("revenue splits: recipient " + recipient + " listed twice");
    }
    total += bps;
  }

  if (total > kBasisPointsTotal) {
    throw streamledger::util::InvalidArgument("revenue splits: shares total " + std::to_string(total) + " bps, above " +
                                              std::to_string(kBasisPointsTotal));
  }
  return splits;
}

uint32_t TotalBasisPoints(const RevenueSplits& splits) {
  uint32_t total = 0;
  for (const auto& [_, bps] : splits) {
    total += bps;
  }
  return total;
}

} // namespace streamledger::ledger
