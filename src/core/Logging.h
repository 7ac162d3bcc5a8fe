#pragma once
#include <string>
#include <mutex>
#include <atomic>
#include <ostream>

namespace cloud_audit {

enum class LogLevel { Critical = 0, Error = 1, Warn = 2, Info = 3, Debug = 4, Trace = 5 };

// Parses "critical", "error", "warn"/"warning", "info", "debug", "trace" (case-insensitive).
bool parse_log_level(const std::string& text, LogLevel& out);

class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level) { level_.store(level); }
    LogLevel level() const { return level_.load(); }

    // Redirect output; nullptr restores std::cerr. The stream must outlive its use.
    void set_sink(std::ostream* sink);

    void log(LogLevel level, const std::string& msg);
    void critical(const std::string& msg) { log(LogLevel::Critical, msg); }
    void error(const std::string& msg) { log(LogLevel::Error, msg); }
    void warn(const std::string& msg) { log(LogLevel::Warn, msg); }
    void info(const std::string& msg) { log(LogLevel::Info, msg); }
    void debug(const std::string& msg) { log(LogLevel::Debug, msg); }
    void trace(const std::string& msg) { log(LogLevel::Trace, msg); }

private:
    Logger() = default;
    static const char* prefix(LogLevel level);

    std::atomic<LogLevel> level_{LogLevel::Info};
    std::ostream* sink_ = nullptr;
    std::mutex mutex_;
};

}
