// common/utils/log.h
#ifndef STAGECRAFT_COMMON_UTILS_LOG_H
#define STAGECRAFT_COMMON_UTILS_LOG_H

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace stagecraft {

enum class LogLevel : uint8_t {
    DEBUG,
    INFO,
    WARN,
    ERROR
};

std::string_view to_string(LogLevel level);
std::optional<LogLevel> parse_log_level(std::string_view text);

// Process-wide line logger writing "[LEVEL] message" to std::cerr.
// Lines are written whole, so concurrent host workers do not interleave.
namespace log {

void set_level(LogLevel level);
LogLevel level();

// Redirect output (tests). Passing nullptr restores std::cerr.
void set_sink(std::ostream* sink);

void write(LogLevel level, std::string_view message);

inline void debug(std::string_view message) { write(LogLevel::DEBUG, message); }
inline void info(std::string_view message) { write(LogLevel::INFO, message); }
inline void warn(std::string_view message) { write(LogLevel::WARN, message); }
inline void error(std::string_view message) { write(LogLevel::ERROR, message); }

} // namespace log

} // namespace stagecraft

#endif // STAGECRAFT_COMMON_UTILS_LOG_H
