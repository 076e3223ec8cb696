// common/utils/log.cpp
#include "common/utils/log.h"
#include <atomic>
#include <iostream>
#include <mutex>

namespace stagecraft {

std::string_view to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "INFO";
}

std::optional<LogLevel> parse_log_level(std::string_view text) {
    if (text == "debug") return LogLevel::DEBUG;
    if (text == "info") return LogLevel::INFO;
    if (text == "warn" || text == "warning") return LogLevel::WARN;
    if (text == "error") return LogLevel::ERROR;
    return std::nullopt;
}

namespace log {

namespace {
std::atomic<LogLevel> g_level{LogLevel::INFO};
std::mutex g_sink_mutex;
std::ostream* g_sink = nullptr;
} // namespace

void set_level(LogLevel lvl) {
    g_level.store(lvl);
}

LogLevel level() {
    return g_level.load();
}

void set_sink(std::ostream* sink) {
    std::lock_guard<std::mutex> lock(g_sink_mutex);
    g_sink = sink;
}

void write(LogLevel lvl, std::string_view message) {
    if (static_cast<uint8_t>(lvl) < static_cast<uint8_t>(g_level.load())) return;

    std::string line;
    line.reserve(message.size() + 10);
    line += '[';
    line += to_string(lvl);
    line += "] ";
    line += message;
    line += '\n';

    std::lock_guard<std::mutex> lock(g_sink_mutex);
    std::ostream& out = g_sink ? *g_sink : std::cerr;
    out << line;
    out.flush();
}

} // namespace log

} // namespace stagecraft
