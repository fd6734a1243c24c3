/// @file time_source.cpp
/// @brief Calendar formatting helpers for audit files and records.

#include "ctc/foundation/time_source.hpp"

#include <cstdio>
#include <ctime>

namespace ctc::foundation {

static std::tm toUtc(WallTimePoint tp) {
    std::time_t tt = WallClock::to_time_t(tp);
    std::tm utc{};
#if defined(_WIN32)
    gmtime_s(&utc, &tt);
#else
    gmtime_r(&tt, &utc);
#endif
    return utc;
}

std::string formatDate(WallTimePoint tp) {
    auto utc = toUtc(tp);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d",
                  utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday);
    return buf;
}

std::string formatCompactDateTime(WallTimePoint tp) {
    auto utc = toUtc(tp);
    char buf[48];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d-%02d%02d%02d",
                  utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
                  utc.tm_hour, utc.tm_min, utc.tm_sec);
    return buf;
}

std::string formatIsoTimestamp(WallTimePoint tp) {
    auto epoch = tp.time_since_epoch();
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(epoch);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(epoch - seconds);
    auto utc = toUtc(tp);

    char buf[96];  // Oversized to satisfy GCC -Wformat-truncation
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
                  utc.tm_hour, utc.tm_min, utc.tm_sec,
                  static_cast<int>(millis.count()));
    return buf;
}

} // namespace ctc::foundation