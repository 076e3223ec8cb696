// common/utils/clock.cpp
#include "common/utils/clock.h"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace stagecraft {

std::string format_rfc3339(std::chrono::system_clock::time_point tp) {
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count() % 1000;
    if (millis < 0) millis += 1000;

    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm utc{};
    gmtime_r(&t, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return oss.str();
}

} // namespace stagecraft
