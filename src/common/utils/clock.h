// common/utils/clock.h
#ifndef STAGECRAFT_COMMON_UTILS_CLOCK_H
#define STAGECRAFT_COMMON_UTILS_CLOCK_H

#include <chrono>
#include <string>

namespace stagecraft {

// RFC 3339 UTC with millisecond precision, e.g. "2025-01-31T12:00:00.123Z".
std::string format_rfc3339(std::chrono::system_clock::time_point tp);

inline std::string rfc3339_now() {
    return format_rfc3339(std::chrono::system_clock::now());
}

} // namespace stagecraft

#endif // STAGECRAFT_COMMON_UTILS_CLOCK_H
