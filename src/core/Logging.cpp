#include "Logging.h"
#include <iostream>
#include <algorithm>
#include <cctype>

namespace cloud_audit {

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::set_sink(std::ostream* sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = sink;
}

const char* Logger::prefix(LogLevel level) {
    switch(level) {
        case LogLevel::Critical: return "[CRITICAL] ";
        case LogLevel::Error: return "[ERROR] ";
        case LogLevel::Warn: return "[WARN] ";
        case LogLevel::Info: return "[INFO] ";
        case LogLevel::Debug: return "[DEBUG] ";
        case LogLevel::Trace: return "[TRACE] ";
    }
    return "";
}

void Logger::log(LogLevel level, const std::string& msg) {
    if(static_cast<int>(level) > static_cast<int>(level_.load())) return;
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostream& os = sink_ ? *sink_ : std::cerr;
    os << prefix(level) << msg << '\n';
}

bool parse_log_level(const std::string& text, LogLevel& out) {
    std::string s = text;
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    if(s == "critical") { out = LogLevel::Critical; return true; }
    if(s == "error") { out = LogLevel::Error; return true; }
    if(s == "warn" || s == "warning") { out = LogLevel::Warn; return true; }
    if(s == "info") { out = LogLevel::Info; return true; }
    if(s == "debug") { out = LogLevel::Debug; return true; }
    if(s == "trace") { out = LogLevel::Trace; return true; }
    return false;
}

}
