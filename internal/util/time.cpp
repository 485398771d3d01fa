#include "time.hpp"

namespace streamledger::util {

uint64_t SystemTimeSource::NowMs() const {
  const auto now  = ToUnixMillis(Clock::now());
  auto       last = last_ms_.load();
  while (now > last && !last_ms_.compare_exchange_weak(last, now)) {
  }
  return now > last ? now : last;
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

} // namespace streamledger::util
