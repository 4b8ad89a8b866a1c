#include "tablepod/core/util/Timestamp.h"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace tablepod::core::util {

std::string FormatUtcTimestamp(TimePoint timestamp) {
    const auto whole = std::chrono::floor<std::chrono::seconds>(timestamp);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(timestamp - whole).count();
    const std::time_t seconds = Clock::to_time_t(whole);
    std::tm utc{};
#ifdef _WIN32
    gmtime_s(&utc, &seconds);
#else
    gmtime_r(&seconds, &utc);
#endif
    std::ostringstream out;
    out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return out.str();
}

// Accepts whole seconds ("...:SSZ") and a fractional part ("...:SS.mmmZ").
// Digits past milliseconds are ignored.
bool ParseUtcTimestamp(const std::string& text, TimePoint& timestamp) {
    std::tm utc{};
    std::istringstream input(text);
    input >> std::get_time(&utc, "%Y-%m-%dT%H:%M:%S");
    if (input.fail()) {
        return false;
    }

    int millis = 0;
    if (input.peek() == '.') {
        input.get();
        int digits = 0;
        while (std::isdigit(input.peek())) {
            const int digit = input.get() - '0';
            if (digits < 3) {
                millis = millis * 10 + digit;
            }
            ++digits;
        }
        if (digits == 0) {
            return false;
        }
        for (; digits < 3; ++digits) {
            millis *= 10;
        }
    }

#ifdef _WIN32
    const std::time_t seconds = _mkgmtime(&utc);
#else
    const std::time_t seconds = timegm(&utc);
#endif
    if (seconds == static_cast<std::time_t>(-1)) {
        return false;
    }
    timestamp = Clock::from_time_t(seconds) + std::chrono::milliseconds(millis);
    return true;
}

}  // namespace tablepod::core::util
