#pragma once

#include "skillmint/common.hpp"
#include <chrono>
#include <string>

namespace skillmint {
namespace time {

// Type aliases for convenience
using Clock = std::chrono::system_clock;
using TimePoint = std::chrono::system_clock::time_point;
using Seconds = std::chrono::seconds;
using Milliseconds = std::chrono::milliseconds;
using Microseconds = std::chrono::microseconds;

// Get current time
TimePoint now();

// Get current Unix timestamp (seconds since epoch)
uint64_t timestamp_seconds();

// Get current Unix timestamp (microseconds since epoch)
uint64_t timestamp_microseconds();

// Convert Unix timestamp to TimePoint
TimePoint from_timestamp(uint64_t timestamp_seconds);

// Convert TimePoint to string (ISO 8601 format)
std::string to_string(const TimePoint& tp);

// UTC calendar day of a timestamp as YYYYMMDD
std::string day_stamp(uint64_t timestamp_seconds);

} // namespace time
} // namespace skillmint
