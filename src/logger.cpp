#include "logger.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace asn2ip {

static std::string now_ts() {
    using namespace std::chrono;
    auto t  = system_clock::now();
    auto tt = system_clock::to_time_t(t);
    auto ms = duration_cast<milliseconds>(t.time_since_epoch()) % 1000;

    std::tm tm{};
    localtime_r(&tt, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.'
        << std::setw(3) << std::setfill('0') << ms.count();
    return oss.str();
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

Logger::Logger()
    : level_(LogLevel::Info), format_(LogFormat::Plain), out_(&std::cerr) {
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

void Logger::set_format(LogFormat format) {
    std::lock_guard<std::mutex> lock(mutex_);
    format_ = format;
}

void Logger::set_output(std::ostream* out) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ = out ? out : &std::cerr;
}

LogLevel Logger::level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

bool Logger::enabled(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(level) <= static_cast<int>(level_);
}

void Logger::log(LogLevel level, const std::string& message, const LogFields& fields) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (static_cast<int>(level) > static_cast<int>(level_)) {
        return;
    }

    std::string line;
    line.reserve(128);

    if (format_ == LogFormat::Json) {
        nlohmann::ordered_json entry;
        entry["time"] = now_ts();
        entry["level"] = log_level_name(level);
        entry["msg"] = message;
        for (const auto& [key, value] : fields) {
            entry[key] = value;
        }
        line = entry.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
    } else {
        line += now_ts();
        line += " [";
        line += log_level_name(level);
        line += "] ";
        line += message;
        for (const auto& [key, value] : fields) {
            line += " " + key + "=" + value;
        }
    }

    *out_ << line << '\n';
    out_->flush();
}

bool parse_log_format(const std::string& text, LogFormat& out) {
    if (text == "plain") {
        out = LogFormat::Plain;
        return true;
    }
    if (text == "json") {
        out = LogFormat::Json;
        return true;
    }
    return false;
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Panic: return "panic";
        case LogLevel::Fatal: return "fatal";
        case LogLevel::Error: return "error";
        case LogLevel::Warn:  return "warning";
        case LogLevel::Info:  return "info";
        case LogLevel::Debug: return "debug";
        case LogLevel::Trace: return "trace";
    }
    return "unknown";
}

} // namespace asn2ip
