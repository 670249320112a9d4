#pragma once

#include <chrono>
#include <cstdint>

namespace registry::util {

/*
  Time utilities. Single place to control the clock source.

  Used only where no host sequence number is supplied.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t ToUnixSeconds(TimePoint tp);

} // namespace registry::util
