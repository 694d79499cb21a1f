#include "skillmint/time_utils.hpp"
#include <sstream>
#include <iomanip>
#include <ctime>

namespace skillmint {
namespace time {

namespace {
    std::tm to_utc(std::time_t time_t_val) {
        std::tm tm_val{};
#ifdef SKILLMINT_PLATFORM_WINDOWS
        gmtime_s(&tm_val, &time_t_val);
#else
        gmtime_r(&time_t_val, &tm_val);
#endif
        return tm_val;
    }
}

TimePoint now() {
    return Clock::now();
}

uint64_t timestamp_seconds() {
    return std::chrono::duration_cast<Seconds>(
        Clock::now().time_since_epoch()
    ).count();
}

uint64_t timestamp_microseconds() {
    return std::chrono::duration_cast<Microseconds>(
        Clock::now().time_since_epoch()
    ).count();
}

TimePoint from_timestamp(uint64_t timestamp_seconds) {
    return TimePoint(Seconds(timestamp_seconds));
}

std::string to_string(const TimePoint& tp) {
    auto tm_val = to_utc(Clock::to_time_t(tp));

    auto ms = std::chrono::duration_cast<Milliseconds>(
        tp.time_since_epoch()
    ).count() % 1000;

    std::ostringstream oss;
    oss << std::put_time(&tm_val, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms << 'Z';
    return oss.str();
}

std::string day_stamp(uint64_t timestamp_seconds) {
    auto tm_val = to_utc(static_cast<std::time_t>(timestamp_seconds));
    std::ostringstream oss;
    oss << std::put_time(&tm_val, "%Y%m%d");
    return oss.str();
}

} // namespace time
} // namespace skillmint
