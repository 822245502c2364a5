#pragma once
#include <string>
#include <mutex>
#include <atomic>

namespace host_audit {

enum class LogLevel { Error=0, Warn=1, Info=2, Debug=3, Trace=4 };

// Operator-facing diagnostic channel (stderr). Never part of the written report.
class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel lvl){ level_.store(lvl); }
    LogLevel level() const { return level_.load(); }

    void log(LogLevel lvl, const std::string& msg);
    void error(const std::string& msg){ log(LogLevel::Error, msg); }
    void warn(const std::string& msg){ log(LogLevel::Warn, msg); }
    void info(const std::string& msg){ log(LogLevel::Info, msg); }
    void debug(const std::string& msg){ log(LogLevel::Debug, msg); }
    void trace(const std::string& msg){ log(LogLevel::Trace, msg); }
private:
    Logger() = default;
    static const char* prefix(LogLevel lvl);
    std::atomic<LogLevel> level_{LogLevel::Info};
    std::mutex mutex_;
};

const char* log_level_name(LogLevel lvl);

}
