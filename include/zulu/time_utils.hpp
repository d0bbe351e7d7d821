#pragma once

#include "zulu/common.hpp"
#include <chrono>
#include <string>

namespace zulu {
namespace time {

// Type aliases for convenience
using Clock = std::chrono::system_clock;
using TimePoint = std::chrono::system_clock::time_point;
using Duration = std::chrono::system_clock::duration;
using Seconds = std::chrono::seconds;
using Milliseconds = std::chrono::milliseconds;

// Get current time
TimePoint now();

// Get current Unix timestamp (seconds since epoch)
uint64_t timestamp_seconds();

// Get current Unix timestamp (milliseconds since epoch)
uint64_t timestamp_milliseconds();

// Convert TimePoint to Unix timestamp (seconds)
uint64_t to_timestamp(const TimePoint& tp);

// Convert Unix timestamp to TimePoint
TimePoint from_timestamp(uint64_t timestamp_seconds);

// Convert TimePoint to string (ISO 8601 format, UTC, millisecond precision)
std::string to_string(const TimePoint& tp);

// Parse ISO 8601 string to TimePoint (throws std::runtime_error on malformed input)
TimePoint from_string(const std::string& str);

// Current time as ISO 8601 string
inline std::string now_string() {
    return to_string(now());
}

// Duration utilities
template<typename Rep, typename Period>
inline uint64_t duration_to_milliseconds(const std::chrono::duration<Rep, Period>& duration) {
    return std::chrono::duration_cast<Milliseconds>(duration).count();
}

// Timer for measuring elapsed time
class Timer {
public:
    Timer() : start_(now()) {}

    // Reset the timer
    void reset() { start_ = now(); }

    // Get elapsed time in milliseconds
    uint64_t elapsed_milliseconds() const {
        return duration_to_milliseconds(now() - start_);
    }

private:
    TimePoint start_;
};

} // namespace time
} // namespace zulu
