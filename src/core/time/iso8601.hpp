#pragma once
#include <chrono>
#include <cstdio>
#include <ctime>
#include <string>

namespace saferclaw::core::time {

    // UTC timestamp with millisecond precision, e.g. 2026-01-31T12:00:00.123Z
    inline std::string to_iso8601(const std::chrono::system_clock::time_point point) {
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                            point.time_since_epoch()).count() % 1000;
        const std::time_t seconds = std::chrono::system_clock::to_time_t(point);
        std::tm utc{};
        gmtime_r(&seconds, &utc);

        char date[32];
        std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &utc);
        char out[48];
        std::snprintf(out, sizeof(out), "%s.%03dZ", date, static_cast<int>(ms));
        return out;
    }

    inline std::string utc_now_iso8601() {
        return to_iso8601(std::chrono::system_clock::now());
    }

} // namespace saferclaw::core::time
