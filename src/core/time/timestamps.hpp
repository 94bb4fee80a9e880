#pragma once
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace knife::core::time {

    // e.g. 2024-05-01T12:00:00.123456Z
    inline std::string to_iso8601_utc(const std::chrono::system_clock::time_point tp) {
        const auto since_epoch = tp.time_since_epoch();
        const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
        const auto micros =
            std::chrono::duration_cast<std::chrono::microseconds>(since_epoch - seconds);
        const std::time_t tt = static_cast<std::time_t>(seconds.count());

        std::tm tm_utc{};
        gmtime_r(&tt, &tm_utc);
        std::ostringstream ss;
        ss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0')
           << std::setw(6) << micros.count() << 'Z';
        return ss.str();
    }

    inline std::string utc_now_iso8601() {
        return to_iso8601_utc(std::chrono::system_clock::now());
    }

    inline double to_unix_seconds(const std::chrono::system_clock::time_point tp) {
        return std::chrono::duration<double>(tp.time_since_epoch()).count();
    }

} // namespace knife::core::time
