#pragma once

#include <cstdint>
#include <vector>

namespace streamledger::ledger {

// Quality tier indices, lowest to highest.
inline constexpr uint32_t kQuality240p  = 0;
inline constexpr uint32_t kQuality480p  = 1;
inline constexpr uint32_t kQuality720p  = 2;
inline constexpr uint32_t kQuality1080p = 3;
inline constexpr uint32_t kQuality4k    = 4;

inline constexpr uint32_t kDefaultMaxQuality     = kQuality4k;
inline constexpr uint32_t kDefaultSessionQuality = kQuality720p;

struct QualityPolicy {
  uint32_t max_tier     = kDefaultMaxQuality;
  uint32_t session_tier = kDefaultSessionQuality;
};

// Throws util::InvalidQuality when tier > policy.max_tier.
void ValidateTier(const QualityPolicy& policy, uint32_t tier);

// Validates every requested tier and returns them sorted without duplicates.
// Throws util::InvalidArgument for an empty request.
std::vector<uint32_t> NormalizeTiers(const QualityPolicy& policy, const std::vector<uint32_t>& requested);

} // namespace streamledger::ledger
