#include "time.hpp"

namespace waveq::util {

uint64_t ToUnixMillis(TimePoint tp) {
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count());
}

uint64_t NowMillis() {
  return ToUnixMillis(Clock::now());
}

uint64_t NowMillisAfter(uint64_t previous) {
  const auto now = NowMillis();
  return now > previous ? now : previous + 1;
}

} // namespace waveq::util
