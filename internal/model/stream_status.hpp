#pragma once

#include <cstdint>
#include <string_view>

namespace streamledger::model {

enum class StreamStatus : std::uint8_t {
  kCreated  = 1,
  kLive     = 2,
  kEnded    = 3,
  kArchived = 4,
};

constexpr bool IsTerminal(StreamStatus status) {
  return status == StreamStatus::kArchived;
}

// Created -> Live -> Ended -> Archived, one step at a time. Self transitions,
// skips and reversals are all rejected.
constexpr bool CanTransition(StreamStatus from, StreamStatus to) {
  if (IsTerminal(from)) {
    return false;
  }
  return static_cast<std::uint8_t>(to) == static_cast<std::uint8_t>(from) + 1;
}

constexpr std::string_view ToString(StreamStatus status) {
  switch (status) {
    case StreamStatus::kCreated:
      return "created";
    case StreamStatus::kLive:
      return "live";
    case StreamStatus::kEnded:
      return "ended";
    case StreamStatus::kArchived:
      return "archived";
  }
  return "unknown";
}

} // namespace streamledger::model
