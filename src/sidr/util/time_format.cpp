#include <sidr/util/time_format.hpp>

#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace sidr {

namespace {

// OLE epoch (1899-12-30) to Unix epoch, in days
constexpr double OLE_TO_UNIX_EPOCH_DAYS = 25569.0;
constexpr double MAX_VALID_OLE = 219146.0;  // ~2500
constexpr double SECONDS_PER_DAY = 86400.0;

// 1601-01-01 to 1970-01-01 in 100 ns ticks
constexpr uint64_t FILETIME_TO_UNIX_EPOCH = 116444736000000000ULL;
constexpr uint64_t MAX_VALID_FILETIME = 283681119990000000ULL;  // ~2500
constexpr uint64_t TICKS_PER_SECOND = 10000000ULL;

std::string format_utc(std::time_t seconds) {
    std::tm tm{};
    if (gmtime_r(&seconds, &tm) == nullptr) {
        return "";
    }

    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

}  // namespace

std::string filetime_to_iso8601(uint64_t filetime) {
    if (filetime < FILETIME_TO_UNIX_EPOCH || filetime > MAX_VALID_FILETIME) {
        return "";
    }
    uint64_t unix_seconds = (filetime - FILETIME_TO_UNIX_EPOCH) / TICKS_PER_SECOND;
    return format_utc(static_cast<std::time_t>(unix_seconds));
}

std::string ole_time_to_iso8601(double ole_time) {
    if (std::isnan(ole_time) || std::isinf(ole_time)) {
        return "";
    }
    if (ole_time < OLE_TO_UNIX_EPOCH_DAYS || ole_time > MAX_VALID_OLE) {
        return "";
    }

    double unix_days = ole_time - OLE_TO_UNIX_EPOCH_DAYS;
    auto unix_seconds = static_cast<int64_t>(std::llround(unix_days * SECONDS_PER_DAY));
    return format_utc(static_cast<std::time_t>(unix_seconds));
}

std::string report_timestamp(std::chrono::system_clock::time_point now) {
    auto since_epoch = now.time_since_epoch();
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(since_epoch - seconds);

    std::time_t t = static_cast<std::time_t>(seconds.count());
    std::tm tm{};
    gmtime_r(&t, &tm);

    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y%m%d_%H%M%S") << '.'
       << std::setw(6) << std::setfill('0') << micros.count();
    return ss.str();
}

}  // namespace sidr
