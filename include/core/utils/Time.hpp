#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace utils {

    inline long long toMillis(std::chrono::system_clock::time_point tp) {
        return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
    }

    /**
     * @brief UTC ISO-8601 with milliseconds, e.g. 2025-08-27T10:15:03.120Z
     */
    inline std::string toIsoString(std::chrono::system_clock::time_point tp) {
        auto seconds = std::chrono::system_clock::to_time_t(tp);
        auto millis = toMillis(tp) % 1000;

        std::tm utc{};
        gmtime_r(&seconds, &utc);

        std::ostringstream oss;
        oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.'
            << std::setw(3) << std::setfill('0') << millis << 'Z';
        return oss.str();
    }

}
