#pragma once

#include <mutex>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace asn2ip {

// Lower value = higher severity. Numbering matches the --log-level flag.
enum class LogLevel {
    Panic = 0,
    Fatal = 1,
    Error = 2,
    Warn  = 3,
    Info  = 4,
    Debug = 5,
    Trace = 6
};

enum class LogFormat {
    Plain,
    Json
};

using LogFields = std::vector<std::pair<std::string, std::string>>;

class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level);
    void set_format(LogFormat format);
    // Not owned; must outlive the logger's use. Defaults to std::cerr.
    void set_output(std::ostream* out);

    LogLevel level() const;
    bool enabled(LogLevel level) const;

    void log(LogLevel level, const std::string& message, const LogFields& fields = {});

private:
    Logger();

    mutable std::mutex mutex_;
    LogLevel level_;
    LogFormat format_;
    std::ostream* out_;
};

bool parse_log_format(const std::string& text, LogFormat& out);
const char* log_level_name(LogLevel level);

inline void log_error(const std::string& msg, const LogFields& fields = {}) {
    Logger::instance().log(LogLevel::Error, msg, fields);
}
inline void log_warn(const std::string& msg, const LogFields& fields = {}) {
    Logger::instance().log(LogLevel::Warn, msg, fields);
}
inline void log_info(const std::string& msg, const LogFields& fields = {}) {
    Logger::instance().log(LogLevel::Info, msg, fields);
}
inline void log_debug(const std::string& msg, const LogFields& fields = {}) {
    Logger::instance().log(LogLevel::Debug, msg, fields);
}

} // namespace asn2ip
