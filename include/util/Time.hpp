#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace util {

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint now();

// ISO-8601 UTC with microseconds, e.g. 2024-05-01T09:30:12.004512Z
std::string to_iso8601(TimePoint tp);
std::string iso_now();

uint64_t to_unix_millis(TimePoint tp);

} // namespace util
