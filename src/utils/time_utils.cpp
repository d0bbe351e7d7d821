#include "zulu/time_utils.hpp"
#include <sstream>
#include <iomanip>
#include <ctime>
#include <stdexcept>

#ifdef _WIN32
// Windows doesn't have timegm, provide a replacement
static time_t timegm_portable(struct tm* tm) {
    return _mkgmtime(tm);
}
#define timegm timegm_portable
#endif

namespace zulu {
namespace time {

TimePoint now() {
    return Clock::now();
}

uint64_t timestamp_seconds() {
    return std::chrono::duration_cast<Seconds>(
        Clock::now().time_since_epoch()
    ).count();
}

uint64_t timestamp_milliseconds() {
    return std::chrono::duration_cast<Milliseconds>(
        Clock::now().time_since_epoch()
    ).count();
}

uint64_t to_timestamp(const TimePoint& tp) {
    return std::chrono::duration_cast<Seconds>(
        tp.time_since_epoch()
    ).count();
}

TimePoint from_timestamp(uint64_t timestamp_seconds) {
    return TimePoint(Seconds(timestamp_seconds));
}

std::string to_string(const TimePoint& tp) {
    auto time_t_val = Clock::to_time_t(tp);
    std::tm tm_val;

#ifdef ZULU_PLATFORM_WINDOWS
    gmtime_s(&tm_val, &time_t_val);
#else
    gmtime_r(&time_t_val, &tm_val);
#endif

    auto ms = std::chrono::duration_cast<Milliseconds>(
        tp.time_since_epoch()
    ).count() % 1000;

    std::ostringstream oss;
    oss << std::put_time(&tm_val, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms << 'Z';
    return oss.str();
}

TimePoint from_string(const std::string& str) {
    // Simple ISO 8601 parser (YYYY-MM-DDTHH:MM:SS[.sss]Z)
    std::tm tm_val = {};
    std::istringstream iss(str);

    iss >> std::get_time(&tm_val, "%Y-%m-%dT%H:%M:%S");

    if (iss.fail()) {
        throw std::runtime_error("Failed to parse time string: " + str);
    }

    int ms = 0;
    if (iss.peek() == '.') {
        char delimiter;
        iss >> delimiter;
        std::string digits;
        while (std::isdigit(iss.peek())) {
            digits.push_back(static_cast<char>(iss.get()));
        }
        // Only the first three fractional digits are significant
        digits = digits.substr(0, 3);
        while (digits.size() < 3) {
            digits.push_back('0');
        }
        ms = std::stoi(digits);
    }

    auto time_t_val = timegm(&tm_val);
    auto tp = Clock::from_time_t(time_t_val);
    tp += Milliseconds(ms);

    return tp;
}

} // namespace time
} // namespace zulu
