#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

namespace streamledger::util {

/*
  Time oracle.

  The ledger never reads a clock directly: every timestamp it records comes
  from the TimeSource handed to the core, in milliseconds since the epoch.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

class TimeSource {
 public:
  virtual ~TimeSource() = default;

  virtual uint64_t NowMs() const = 0;
};

// Wall clock that never reports a value smaller than one it already returned.
class SystemTimeSource final : public TimeSource {
 public:
  uint64_t NowMs() const override;

 private:
  mutable std::atomic<uint64_t> last_ms_{0};
};

// Caller-driven clock for tests and replay.
class ManualTimeSource final : public TimeSource {
 public:
  explicit ManualTimeSource(uint64_t start_ms = 0) : now_ms_(start_ms) {
  }

  uint64_t NowMs() const override {
    return now_ms_.load();
  }

  void Set(uint64_t now_ms) {
    now_ms_.store(now_ms);
  }

  void Advance(uint64_t delta_ms) {
    now_ms_.fetch_add(delta_ms);
  }

 private:
  std::atomic<uint64_t> now_ms_;
};

uint64_t ToUnixMillis(TimePoint tp);

} // namespace streamledger::util
