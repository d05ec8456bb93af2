#pragma once

#include <chrono>
#include <cstdint>

namespace waveq::util {

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

uint64_t ToUnixMillis(TimePoint tp);
uint64_t NowMillis();

// Wall-clock millis, bumped past `previous` when the clock has not advanced
// (or stepped backwards) so successive updated_at values strictly increase.
uint64_t NowMillisAfter(uint64_t previous);

} // namespace waveq::util
