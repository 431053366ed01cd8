#pragma once
#include <chrono>
#include <string>

namespace helios {

using WallClock = std::chrono::system_clock;

// ISO-8601 UTC with microseconds and explicit offset:
//   2026-10-19T08:15:02.123456+00:00
std::string iso_utc(WallClock::time_point tp);

std::string iso_utc_now();

} // namespace helios
