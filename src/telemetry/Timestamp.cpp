#include "telemetry/Timestamp.hpp"
#include <cstdio>
#include <ctime>

using namespace helios;

std::string helios::iso_utc(WallClock::time_point tp) {
    using namespace std::chrono;

    auto since_epoch = tp.time_since_epoch();
    auto secs = duration_cast<seconds>(since_epoch);
    auto micros = duration_cast<microseconds>(since_epoch - secs).count();
    if (micros < 0) {
        secs -= seconds(1);
        micros += 1000000;
    }

    std::time_t t = static_cast<std::time_t>(secs.count());
    std::tm tm_utc{};
    gmtime_r(&t, &tm_utc);

    char buf[48];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06lld+00:00",
                  tm_utc.tm_year + 1900, tm_utc.tm_mon + 1, tm_utc.tm_mday,
                  tm_utc.tm_hour, tm_utc.tm_min, tm_utc.tm_sec,
                  static_cast<long long>(micros));
    return buf;
}

std::string helios::iso_utc_now() {
    return iso_utc(WallClock::now());
}
