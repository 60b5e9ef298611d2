#include "util/Time.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace util {

TimePoint now() {
    return Clock::now();
}

std::string to_iso8601(TimePoint tp) {
    auto secs   = std::chrono::time_point_cast<std::chrono::seconds>(tp);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(tp - secs).count();
    if (micros < 0) {
        secs -= std::chrono::seconds(1);
        micros += 1000000;
    }

    std::time_t t = Clock::to_time_t(secs);
    std::tm tm{};
    gmtime_r(&t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.'
        << std::setw(6) << std::setfill('0') << micros << 'Z';
    return oss.str();
}

std::string iso_now() {
    return to_iso8601(now());
}

uint64_t to_unix_millis(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

} // namespace util
