#include <common/log.hpp>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <mutex>
#include <stdexcept>

namespace cs {
    namespace {
        std::atomic<int> g_log_level{static_cast<int>(LogLevel::Info)};
        std::mutex g_log_mu;
    } // namespace

    void set_log_level(LogLevel level) {
        g_log_level.store(static_cast<int>(level), std::memory_order_relaxed);
    }

    LogLevel log_level() {
        return static_cast<LogLevel>(g_log_level.load(std::memory_order_relaxed));
    }

    LogLevel log_level_from_str(const std::string& s) {
        std::string v = s;
        std::transform(v.begin(),
                       v.end(),
                       v.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (v == "error") return LogLevel::Error;
        if (v == "warn" || v == "warning") return LogLevel::Warn;
        if (v == "info") return LogLevel::Info;
        if (v == "debug") return LogLevel::Debug;
        throw std::runtime_error("[Config] unknown log level: " + s);
    }

    void log_write(LogLevel level, const std::string& line) {
        // scans run on two threads; keep lines whole
        std::lock_guard lk(g_log_mu);
        if (level == LogLevel::Error) {
            std::cerr << "[E] " << line << "\n";
        } else if (level == LogLevel::Warn) {
            std::cerr << "[W] " << line << "\n";
        } else {
            std::cerr << line << "\n";
        }
    }
}
