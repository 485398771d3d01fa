#include "quality.hpp"

#include <algorithm>
#include <string>

#include "internal/util/errors.hpp"

namespace streamledger::ledger {

void ValidateTier(const QualityPolicy& policy, uint32_t tier) {
  if (tier > policy.max_tier) {
    throw streamledger::util::InvalidQuality("quality tier " + std::to_string(tier) + " exceeds supported maximum " +
                                             std::to_string(policy.max_tier));
  }
}

std::vector<uint32_t> NormalizeTiers(const QualityPolicy& policy, const std::vector<uint32_t>& requested) {
  if (requested.empty()) {
    throw streamledger::util::InvalidArgument("quality levels: at least one tier is required");
  }

  for (const auto tier : requested) {
    ValidateTier(policy, tier);
  }

  std::vector<uint32_t> tiers(requested);
  std::sort(tiers.begin(), tiers.end());
  tiers.erase(std::unique(tiers.begin(), tiers.end()), tiers.end());
  return tiers;
}

} // namespace streamledger::ledger
