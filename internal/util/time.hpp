#pragma once

#include <chrono>
#include <cstdint>

namespace tally::util {

/*
  Time utilities. Every persisted timestamp is unix milliseconds.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t NowMs();

uint64_t ToUnixMillis(TimePoint tp);

} // namespace tally::util
