#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace filedrop::util {

namespace detail {
inline std::tm utc_tm(std::chrono::system_clock::time_point tp) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_buf{};
    gmtime_r(&seconds, &tm_buf);
    return tm_buf;
}
}  // namespace detail

// 2024-05-01T12:30:00.250Z
inline std::string format_rfc3339(std::chrono::system_clock::time_point tp) {
    const auto tm_buf = detail::utc_tm(tp);
    const auto since_epoch = tp.time_since_epoch();
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch).count() % 1000;
    if (millis < 0) {
        millis += 1000;
    }
    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return oss.str();
}

// IMF-fixdate, as used by Last-Modified.
inline std::string format_http_date(std::chrono::system_clock::time_point tp) {
    static constexpr const char* kDays[] = {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
    static constexpr const char* kMonths[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                              "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};
    const auto tm_buf = detail::utc_tm(tp);
    std::ostringstream oss;
    oss << kDays[tm_buf.tm_wday] << ", " << std::setw(2) << std::setfill('0') << tm_buf.tm_mday << ' '
        << kMonths[tm_buf.tm_mon] << ' ' << (tm_buf.tm_year + 1900) << ' '
        << std::put_time(&tm_buf, "%H:%M:%S") << " GMT";
    return oss.str();
}

}  // namespace filedrop::util
