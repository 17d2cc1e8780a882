#pragma once

#include <chrono>
#include <cstdint>

namespace orchestrator::util {

/*
  Time utilities. Single place to control the clock source.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t ToUnixMillis(TimePoint tp);
uint64_t NowMillis();

} // namespace orchestrator::util
