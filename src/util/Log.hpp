#pragma once

#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>

namespace photorelay::util {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

// Process-wide log sink. Lines look like "[INFO] [relay] message".
class Log {
public:
    static void set_level(LogLevel lvl) {
        std::lock_guard<std::mutex> lk(mu());
        level() = lvl;
    }

    static void write(LogLevel lvl, std::string_view tag, std::string_view msg) {
        std::lock_guard<std::mutex> lk(mu());
        if (lvl < level()) return;

        std::ostream& out = lvl >= LogLevel::Warn ? std::cerr : std::cout;
        out << '[' << name_of(lvl) << "] [" << tag << "] " << msg << '\n';
        out.flush();
    }

    static const char* name_of(LogLevel lvl) {
        switch (lvl) {
            case LogLevel::Debug: return "DEBUG";
            case LogLevel::Info:  return "INFO";
            case LogLevel::Warn:  return "WARN";
            case LogLevel::Error: return "ERROR";
        }
        return "?";
    }

    // Accepts "debug", "info", "warn"/"warning", "error". Returns false otherwise.
    static bool parse_level(std::string_view s, LogLevel& out) {
        if (s == "debug") { out = LogLevel::Debug; return true; }
        if (s == "info")  { out = LogLevel::Info;  return true; }
        if (s == "warn" || s == "warning") { out = LogLevel::Warn; return true; }
        if (s == "error") { out = LogLevel::Error; return true; }
        return false;
    }

private:
    static std::mutex& mu() {
        static std::mutex m;
        return m;
    }

    static LogLevel& level() {
        static LogLevel lvl = LogLevel::Info;
        return lvl;
    }
};

// Builds the message with operator<< and writes it on destruction:
//   LogLine(LogLevel::Info, "relay") << "desktop registered for " << id;
class LogLine {
public:
    LogLine(LogLevel lvl, std::string_view tag) : lvl_(lvl), tag_(tag) {}
    ~LogLine() { Log::write(lvl_, tag_, os_.str()); }

    LogLine(const LogLine&) = delete;
    LogLine& operator=(const LogLine&) = delete;

    template <typename T>
    LogLine& operator<<(const T& v) {
        os_ << v;
        return *this;
    }

private:
    LogLevel lvl_;
    std::string tag_;
    std::ostringstream os_;
};

inline LogLine log_debug(std::string_view tag) { return LogLine(LogLevel::Debug, tag); }
inline LogLine log_info(std::string_view tag)  { return LogLine(LogLevel::Info, tag); }
inline LogLine log_warn(std::string_view tag)  { return LogLine(LogLevel::Warn, tag); }
inline LogLine log_error(std::string_view tag) { return LogLine(LogLevel::Error, tag); }

} // namespace photorelay::util
