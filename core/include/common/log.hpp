#pragma once

#include <iostream>
#include <sstream>
#include <string>

namespace cs {
    enum class LogLevel {
        Error = 0,
        Warn = 1,
        Info = 2,
        Debug = 3
    };

    void set_log_level(LogLevel level);
    LogLevel log_level();

    // Throws std::runtime_error on unknown names.
    LogLevel log_level_from_str(const std::string& s);

    inline bool log_enabled(LogLevel level) {
        return static_cast<int>(level) <= static_cast<int>(log_level());
    }

    void log_write(LogLevel level, const std::string& line);
}

// Usage: CS_LOG(cs::LogLevel::Info, "[Scanner](scan) fps=" << fps);
#define CS_LOG(level, message)                          \
    do {                                                \
        if (cs::log_enabled(level)) {                   \
            std::ostringstream _cs_log_ss;              \
            _cs_log_ss << message;                      \
            cs::log_write(level, _cs_log_ss.str());     \
        }                                               \
    } while (0)
